#include "tcp_receiver.hh"
#include "tcp_config.hh"

#include <algorithm>

using namespace std;

uint64_t TCPReceiver::absolute_ackno() const
{
  // SYN, then every byte pushed, then FIN once the stream is complete
  return 1 + reassembler_.writer().bytes_pushed() + ( reassembler_.writer().is_closed() ? 1 : 0 );
}

TCPReceiver::Outcome TCPReceiver::receive( const Segment& segment )
{
  if ( segment.has( Segment::FLAG_SYN ) ) {
    if ( not isn_.has_value() ) {
      // the SYN that opens the stream: its payload starts at index 0 and nothing precedes it
      isn_ = segment.seqno;
      reassembler_.insert( 0, segment.payload, segment.has( Segment::FLAG_FIN ) );
      return { .needs_ack = true, .dropped = nullopt };
    }
    if ( not( segment.seqno == *isn_ ) ) {
      return { .needs_ack = false, .dropped = DropReason::ILLEGAL_STATE }; // someone else's connection
    }
  }

  if ( not isn_.has_value() ) {
    return { .needs_ack = false, .dropped = DropReason::ILLEGAL_STATE };
  }

  const uint64_t ackno = absolute_ackno();
  const uint64_t seqno = segment.seqno.unwrap( *isn_, ackno );

  if ( segment.sequence_length() == 0 ) {
    // A bare acknowledgment needs no answer; anything behind our cursor asks for our window.
    return { .needs_ack = seqno < ackno, .dropped = nullopt };
  }

  if ( seqno + segment.sequence_length() <= ackno ) {
    return { .needs_ack = true, .dropped = DropReason::DUPLICATE };
  }

  const uint64_t window = window_size();
  const bool fits = window == 0 ? seqno == ackno : seqno < ackno + window;
  if ( not fits or ( seqno == 0 and not segment.has( Segment::FLAG_SYN ) ) ) {
    return { .needs_ack = true, .dropped = DropReason::OUT_OF_WINDOW };
  }

  const uint64_t stream_index = segment.has( Segment::FLAG_SYN ) ? 0 : seqno - 1;
  reassembler_.insert( stream_index, segment.payload, segment.has( Segment::FLAG_FIN ) );
  return { .needs_ack = true, .dropped = nullopt };
}

optional<Wrap32> TCPReceiver::ackno() const
{
  if ( not isn_.has_value() ) {
    return nullopt;
  }
  return Wrap32::wrap( absolute_ackno(), *isn_ );
}

uint16_t TCPReceiver::window_size() const
{
  return static_cast<uint16_t>(
    min<uint64_t>( reassembler_.writer().available_capacity(), TCPConfig::MAX_WINDOW ) );
}
