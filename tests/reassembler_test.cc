#include "reassembler.hh"

#include <gtest/gtest.h>

#include <string>

using namespace std;

namespace {
string drain( Reassembler& reassembler )
{
  string out;
  read( reassembler.reader(), UINT64_MAX, out );
  return out;
}
} // namespace

TEST( Reassembler, InOrderPassesStraightThrough )
{
  Reassembler reassembler { ByteStream { 64 } };
  reassembler.insert( 0, "abc", false );
  reassembler.insert( 3, "def", true );
  EXPECT_EQ( drain( reassembler ), "abcdef" );
  EXPECT_TRUE( reassembler.reader().is_finished() );
}

TEST( Reassembler, HoldsGapsUntilFilled )
{
  Reassembler reassembler { ByteStream { 64 } };
  reassembler.insert( 6, "ghi", true );
  reassembler.insert( 3, "def", false );
  EXPECT_EQ( reassembler.count_bytes_pending(), 6U );
  EXPECT_EQ( drain( reassembler ), "" );

  reassembler.insert( 0, "abc", false );
  EXPECT_EQ( reassembler.count_bytes_pending(), 0U );
  EXPECT_EQ( drain( reassembler ), "abcdefghi" );
  EXPECT_TRUE( reassembler.writer().is_closed() );
}

TEST( Reassembler, DuplicatesAndOverlapsDeliverOnce )
{
  Reassembler reassembler { ByteStream { 64 } };
  reassembler.insert( 2, "cde", false );
  reassembler.insert( 2, "cde", false );
  reassembler.insert( 4, "efgh", false );
  EXPECT_EQ( reassembler.count_bytes_pending(), 6U );

  reassembler.insert( 0, "abcd", false );
  reassembler.insert( 0, "ab", false );
  EXPECT_EQ( drain( reassembler ), "abcdefgh" );
  EXPECT_EQ( reassembler.writer().bytes_pushed(), 8U );
}

TEST( Reassembler, DiscardsBeyondCapacity )
{
  Reassembler reassembler { ByteStream { 4 } };
  reassembler.insert( 2, "cdefgh", false );
  EXPECT_EQ( reassembler.count_bytes_pending(), 2U );
  reassembler.insert( 0, "ab", false );
  EXPECT_EQ( drain( reassembler ), "abcd" );

  // space freed; the dropped tail must be resent
  reassembler.insert( 4, "efgh", true );
  EXPECT_EQ( drain( reassembler ), "efgh" );
  EXPECT_TRUE( reassembler.reader().is_finished() );
}

TEST( Reassembler, EmptyLastSubstringCloses )
{
  Reassembler reassembler { ByteStream { 8 } };
  reassembler.insert( 0, "", true );
  EXPECT_TRUE( reassembler.reader().is_finished() );
}
