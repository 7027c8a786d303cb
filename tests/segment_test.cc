#include "segment.hh"

#include <gtest/gtest.h>

#include <string>

using namespace std;

namespace {

Segment sample()
{
  Segment segment;
  segment.flags = Segment::FLAG_ACK;
  segment.seqno = Wrap32 { 0x01020304 };
  segment.ackno = Wrap32 { 0xA0B0C0D0 };
  segment.window = 4096;
  segment.payload = "hello, world";
  segment.seal();
  return segment;
}

} // namespace

TEST( Segment, HeaderLayoutIsBigEndian )
{
  const string bytes = sample().serialize();
  ASSERT_EQ( bytes.size(), Segment::HEADER_LENGTH + 12 );
  EXPECT_EQ( static_cast<uint8_t>( bytes[0] ), Segment::FLAG_ACK );
  EXPECT_EQ( static_cast<uint8_t>( bytes[1] ), 0x01 );
  EXPECT_EQ( static_cast<uint8_t>( bytes[4] ), 0x04 );
  EXPECT_EQ( static_cast<uint8_t>( bytes[5] ), 0xA0 );
  EXPECT_EQ( static_cast<uint8_t>( bytes[9] ), 0x10 );
  EXPECT_EQ( static_cast<uint8_t>( bytes[10] ), 0x00 );
  EXPECT_EQ( bytes.substr( Segment::HEADER_LENGTH ), "hello, world" );
}

TEST( Segment, ParsesWhatItSerialized )
{
  const Segment original = sample();
  Segment parsed;
  ASSERT_TRUE( parse( parsed, original.serialize() ) );
  EXPECT_FALSE( parsed.is_corrupt() );
  EXPECT_EQ( parsed.flags, original.flags );
  EXPECT_EQ( parsed.seqno, original.seqno );
  EXPECT_EQ( parsed.ackno, original.ackno );
  EXPECT_EQ( parsed.window, original.window );
  EXPECT_EQ( parsed.payload, original.payload );
}

TEST( Segment, EveryFlippedBitIsCaught )
{
  const string clean = sample().serialize();
  for ( size_t byte = 0; byte < clean.size(); byte++ ) {
    for ( int bit = 0; bit < 8; bit++ ) {
      string damaged = clean;
      damaged[byte] = static_cast<char>( damaged[byte] ^ ( 1 << bit ) );

      Segment parsed;
      const bool parsed_ok = parse( parsed, damaged );
      EXPECT_TRUE( not parsed_ok or parsed.is_corrupt() ) << "byte " << byte << " bit " << bit;
    }
  }
}

TEST( Segment, ShortBufferIsMalformed )
{
  const string bytes = sample().serialize();
  Segment parsed;
  EXPECT_FALSE( parse( parsed, "" ) );
  EXPECT_FALSE( parse( parsed, bytes.substr( 0, Segment::HEADER_LENGTH - 1 ) ) );
}

TEST( Segment, EmptyPayloadIsWellFormed )
{
  Segment ack;
  ack.flags = Segment::FLAG_ACK;
  ack.seal();
  Segment parsed;
  ASSERT_TRUE( parse( parsed, ack.serialize() ) );
  EXPECT_FALSE( parsed.is_corrupt() );
  EXPECT_EQ( parsed.kind(), Segment::Kind::ACK );
}

TEST( Segment, ImpossibleFlagsAreMalformed )
{
  EXPECT_FALSE( valid_flags( Segment::FLAG_SYN | Segment::FLAG_FIN ) );
  EXPECT_FALSE( valid_flags( Segment::FLAG_RST | Segment::FLAG_SYN ) );
  EXPECT_FALSE( valid_flags( Segment::FLAG_RST | Segment::FLAG_FIN ) );
  EXPECT_FALSE( valid_flags( 0x80 ) );
  EXPECT_TRUE( valid_flags( Segment::FLAG_SYN | Segment::FLAG_ACK ) );
  EXPECT_TRUE( valid_flags( Segment::FLAG_RST | Segment::FLAG_ACK ) );
  EXPECT_TRUE( valid_flags( 0 ) );

  Segment bad = sample();
  bad.flags = Segment::FLAG_SYN | Segment::FLAG_FIN;
  bad.seal();
  Segment parsed;
  EXPECT_FALSE( parse( parsed, bad.serialize() ) );
}

TEST( Segment, KindFollowsFlags )
{
  Segment segment;
  EXPECT_EQ( segment.kind(), Segment::Kind::DATA );
  segment.flags = Segment::FLAG_SYN;
  EXPECT_EQ( segment.kind(), Segment::Kind::SYN );
  segment.flags = Segment::FLAG_SYN | Segment::FLAG_ACK;
  EXPECT_EQ( segment.kind(), Segment::Kind::SYN_ACK );
  segment.flags = Segment::FLAG_FIN | Segment::FLAG_ACK;
  EXPECT_EQ( segment.kind(), Segment::Kind::FIN_ACK );
  segment.flags = Segment::FLAG_RST | Segment::FLAG_ACK;
  EXPECT_EQ( segment.kind(), Segment::Kind::RST );
  segment.flags = Segment::FLAG_ACK;
  segment.payload = "x";
  EXPECT_EQ( segment.kind(), Segment::Kind::DATA );
}

TEST( Segment, ControlFlagsOccupySequenceNumbers )
{
  Segment segment;
  segment.payload = "abc";
  EXPECT_EQ( segment.sequence_length(), 3U );
  segment.flags = Segment::FLAG_SYN;
  EXPECT_EQ( segment.sequence_length(), 4U );
  segment.flags = Segment::FLAG_FIN | Segment::FLAG_ACK;
  EXPECT_EQ( segment.sequence_length(), 4U );
}

TEST( Segment, ChangedFieldWithoutResealIsCorrupt )
{
  Segment segment = sample();
  segment.ackno = segment.ackno + 1;
  EXPECT_TRUE( segment.is_corrupt() );
  segment.seal();
  EXPECT_FALSE( segment.is_corrupt() );
}
