#include "segment.hh"
#include "checksum.hh"
#include "parser.hh"

#include <sstream>

using namespace std;

namespace {

// flags(1) seqno(4) ackno(4) window(2), all big-endian; the checksum field follows
void serialize_header_without_checksum( const Segment& segment, Serializer& serializer )
{
  serializer.integer( segment.flags );
  serializer.integer( segment.seqno.raw_value() );
  serializer.integer( segment.ackno.raw_value() );
  serializer.integer( segment.window );
}

} // namespace

bool valid_flags( const uint8_t flags )
{
  if ( flags & ~Segment::KNOWN_FLAGS ) {
    return false; // reserved bits set
  }

  const bool syn = flags & Segment::FLAG_SYN;
  const bool fin = flags & Segment::FLAG_FIN;
  const bool rst = flags & Segment::FLAG_RST;

  if ( syn and fin ) {
    return false;
  }
  // a reset carries nothing else
  if ( rst and ( syn or fin ) ) {
    return false;
  }
  return true;
}

// RST wins over everything; ACK alone is a kind only when nothing else rides on it
Segment::Kind Segment::kind() const
{
  if ( has( FLAG_RST ) ) {
    return Kind::RST;
  }
  if ( has( FLAG_SYN ) ) {
    return has( FLAG_ACK ) ? Kind::SYN_ACK : Kind::SYN;
  }
  if ( has( FLAG_FIN ) ) {
    return has( FLAG_ACK ) ? Kind::FIN_ACK : Kind::FIN;
  }
  if ( has( FLAG_ACK ) and payload.empty() ) {
    return Kind::ACK;
  }
  return Kind::DATA;
}

uint32_t Segment::compute_checksum() const
{
  Serializer header;
  serialize_header_without_checksum( *this, header );

  // the checksum covers every byte on the wire except itself
  CRC32 crc;
  crc.add( header.finish() );
  crc.add( payload );
  return crc.value();
}

string Segment::serialize() const
{
  Serializer serializer;
  serialize_header_without_checksum( *this, serializer );
  serializer.integer( checksum );
  serializer.buffer( payload );
  return serializer.finish();
}

bool parse( Segment& segment, const string_view buffer )
{
  if ( buffer.size() < Segment::HEADER_LENGTH ) {
    return false;
  }

  Parser parser { buffer };
  uint32_t seqno {};
  uint32_t ackno {};

  parser.integer( segment.flags );
  parser.integer( seqno );
  parser.integer( ackno );
  parser.integer( segment.window );
  parser.integer( segment.checksum );
  parser.all_remaining( segment.payload ); // the payload runs to the end of the datagram

  // a corrupt checksum is not a parse error; receivers count it separately
  if ( parser.has_error() or not valid_flags( segment.flags ) ) {
    return false;
  }

  segment.seqno = Wrap32 { seqno };
  segment.ackno = Wrap32 { ackno };
  return true;
}

string to_string( const Segment::Kind kind )
{
  switch ( kind ) {
    case Segment::Kind::DATA:
      return "DATA";
    case Segment::Kind::ACK:
      return "ACK";
    case Segment::Kind::SYN:
      return "SYN";
    case Segment::Kind::SYN_ACK:
      return "SYN_ACK";
    case Segment::Kind::FIN:
      return "FIN";
    case Segment::Kind::FIN_ACK:
      return "FIN_ACK";
    case Segment::Kind::RST:
      return "RST";
  }
  return "UNKNOWN";
}

string Segment::to_string() const
{
  ostringstream ss;
  ss << "[" << ::to_string( kind() ) << " seq=" << seqno.raw_value();
  if ( has( FLAG_ACK ) ) {
    ss << " ack=" << ackno.raw_value();
  }
  ss << " win=" << window << " len=" << payload.size() << "]";
  return ss.str();
}

string to_string( const DropReason reason )
{
  switch ( reason ) {
    case DropReason::MALFORMED:
      return "malformed";
    case DropReason::CORRUPT:
      return "corrupt";
    case DropReason::DUPLICATE:
      return "duplicate";
    case DropReason::OUT_OF_WINDOW:
      return "out of window";
    case DropReason::ILLEGAL_STATE:
      return "illegal state";
  }
  return "unknown";
}
