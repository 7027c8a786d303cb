#include "lossy_channel.hh"
#include "memory_channel.hh"
#include "udp_channel.hh"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace std::chrono_literals;

namespace {

const Address LEFT { "10.0.0.1", 1000 };
const Address RIGHT { "10.0.0.2", 2000 };

vector<string> drain( DatagramChannel& channel, chrono::milliseconds timeout = 0ms )
{
  vector<string> out;
  while ( auto datagram = channel.receive_datagram( timeout ) ) {
    out.push_back( move( datagram->payload ) );
  }
  return out;
}

} // namespace

TEST( MemoryChannel, DeliversToPeerWithSenderAddress )
{
  auto [left, right] = MemoryChannel::make_pair( LEFT, RIGHT );
  left->send_datagram( RIGHT, "ping" );
  EXPECT_EQ( right->pending(), 1U );

  const auto datagram = right->receive_datagram( 0ms );
  ASSERT_TRUE( datagram.has_value() );
  EXPECT_EQ( datagram->payload, "ping" );
  EXPECT_EQ( datagram->peer, LEFT );
  EXPECT_FALSE( left->receive_datagram( 1ms ).has_value() );
}

TEST( LossyChannel, CleanProfilePassesEverythingInOrder )
{
  auto [left, right] = MemoryChannel::make_pair( LEFT, RIGHT );
  LossyChannel lossy { left, LossProfile {} };
  for ( int i = 0; i < 10; i++ ) {
    lossy.send_datagram( RIGHT, to_string( i ) );
  }
  EXPECT_EQ( drain( *right ), ( vector<string> { "0", "1", "2", "3", "4", "5", "6", "7", "8", "9" } ) );
  EXPECT_EQ( lossy.statistics().datagrams_sent, 10U );
  EXPECT_EQ( lossy.statistics().datagrams_lost, 0U );
}

TEST( LossyChannel, TotalLossDeliversNothing )
{
  auto [left, right] = MemoryChannel::make_pair( LEFT, RIGHT );
  LossyChannel lossy { left, LossProfile { .loss_rate = 1.0 } };
  for ( int i = 0; i < 10; i++ ) {
    lossy.send_datagram( RIGHT, "gone" );
  }
  EXPECT_TRUE( drain( *right ).empty() );
  EXPECT_EQ( lossy.statistics().datagrams_lost, 10U );
}

TEST( LossyChannel, CorruptionChangesBytesNotLength )
{
  auto [left, right] = MemoryChannel::make_pair( LEFT, RIGHT );
  LossyChannel lossy { left, LossProfile { .corrupt_rate = 1.0, .seed = 3 } };
  const string original = "z"; // one byte, so exactly one inversion
  lossy.send_datagram( RIGHT, original );

  const auto received = drain( *right );
  ASSERT_EQ( received.size(), 1U );
  EXPECT_EQ( received[0].size(), original.size() );
  EXPECT_NE( received[0], original );
  EXPECT_EQ( lossy.statistics().datagrams_corrupted, 1U );
}

TEST( LossyChannel, DuplicationDeliversTwice )
{
  auto [left, right] = MemoryChannel::make_pair( LEFT, RIGHT );
  LossyChannel lossy { left, LossProfile { .duplicate_rate = 1.0 } };
  lossy.send_datagram( RIGHT, "echo" );
  EXPECT_EQ( drain( *right ), ( vector<string> { "echo", "echo" } ) );
}

TEST( LossyChannel, SameSeedSameTrace )
{
  const LossProfile profile { .loss_rate = 0.5, .seed = 99 };
  vector<vector<string>> traces;
  for ( int run = 0; run < 2; run++ ) {
    auto [left, right] = MemoryChannel::make_pair( LEFT, RIGHT );
    LossyChannel lossy { left, profile };
    for ( int i = 0; i < 50; i++ ) {
      lossy.send_datagram( RIGHT, to_string( i ) );
    }
    traces.push_back( drain( *right ) );
  }
  EXPECT_EQ( traces[0], traces[1] );
  EXPECT_LT( traces[0].size(), 50U );
}

TEST( LossyChannel, DelayHoldsDatagramsBack )
{
  auto [left, right] = MemoryChannel::make_pair( LEFT, RIGHT );
  LossyChannel lossy { left, LossProfile { .min_delay_ms = 30, .max_delay_ms = 60, .seed = 5 } };
  for ( int i = 0; i < 20; i++ ) {
    lossy.send_datagram( RIGHT, to_string( i ) );
  }
  EXPECT_FALSE( right->receive_datagram( 0ms ).has_value() );

  vector<string> received;
  while ( received.size() < 20 ) {
    auto datagram = right->receive_datagram( 500ms );
    ASSERT_TRUE( datagram.has_value() );
    received.push_back( datagram->payload );
  }
  EXPECT_GE( lossy.statistics().total_delay_ms, 20U * 30 );
}

TEST( UDPChannel, LoopbackRoundTrip )
{
  UDPChannel a { Address { "127.0.0.1", 0 } };
  UDPChannel b { Address { "127.0.0.1", 0 } };
  ASSERT_NE( a.local_address().port(), 0 );

  a.send_datagram( b.local_address(), "over the wire" );
  const auto datagram = b.receive_datagram( 1000ms );
  ASSERT_TRUE( datagram.has_value() );
  EXPECT_EQ( datagram->payload, "over the wire" );
  EXPECT_EQ( datagram->peer, a.local_address() );

  EXPECT_FALSE( a.receive_datagram( 10ms ).has_value() );
}

TEST( Address, DottedQuadAndPort )
{
  const Address address { "192.168.7.9", 4242 };
  EXPECT_EQ( address.ip(), "192.168.7.9" );
  EXPECT_EQ( address.port(), 4242 );
  EXPECT_EQ( address.to_string(), "192.168.7.9:4242" );
  EXPECT_TRUE( address == ( Address { "192.168.7.9", 4242 } ) );
  EXPECT_TRUE( address != ( Address { "192.168.7.9", 4243 } ) );

  EXPECT_THROW( Address( "localhost", 80 ), invalid_argument );
  EXPECT_THROW( Address( "10.0.0.256", 80 ), invalid_argument );
}
