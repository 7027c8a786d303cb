#include "lossy_channel.hh"
#include "memory_channel.hh"
#include "tcp_socket.hh"
#include "udp_channel.hh"

#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <string>

using namespace std;
using namespace std::chrono_literals;

namespace {

const Address CLIENT { "10.0.0.1", 4000 };
const Address SERVER { "10.0.0.2", 5000 };

string sample_data( size_t size )
{
  string out;
  out.reserve( size );
  for ( size_t i = 0; i < size; i++ ) {
    out.push_back( static_cast<char>( 'a' + ( i * 7 ) % 26 ) );
  }
  return out;
}

string read_to_end( TCPSocket& socket, chrono::milliseconds timeout )
{
  const auto deadline = chrono::steady_clock::now() + timeout;
  string out;
  while ( not socket.eof() and chrono::steady_clock::now() < deadline ) {
    out += socket.read( UINT64_MAX, 100ms );
  }
  return out;
}

TCPConfig quick_config()
{
  TCPConfig config;
  config.initial_rto_ms = 100;
  config.min_rto_ms = 20;
  config.max_rto_ms = 1000;
  config.max_retransmissions = 20;
  config.time_wait_ms = 100;
  return config;
}

// Connect, send `data` from client to server, then close both ways.
void transfer( const shared_ptr<DatagramChannel>& client_channel,
               const shared_ptr<DatagramChannel>& server_channel,
               const string& data,
               const TCPConfig& config )
{
  TCPSocket server { server_channel, config };
  TCPSocket client { client_channel, config };

  auto accepted = async( launch::async, [&server] { server.accept( 10s ); } );
  client.connect( server_channel->local_address(), 10s );
  accepted.get();
  EXPECT_EQ( client.state(), TCPState::ESTABLISHED );
  ASSERT_TRUE( server.peer().has_value() );
  EXPECT_EQ( *server.peer(), client_channel->local_address() );

  auto sent = async( launch::async, [&] {
    client.write( data, 20s );
    client.close();
  } );
  EXPECT_EQ( read_to_end( server, 30s ), data );
  sent.get();

  EXPECT_TRUE( client.wait_until_flushed( 10s ) );
  server.close();
  EXPECT_TRUE( server.wait_until_closed( 10s ) );
  EXPECT_TRUE( client.wait_until_closed( 10s ) );
  EXPECT_TRUE( client.eof() );
}

} // namespace

TEST( TCPSocket, TransferOverMemoryChannel )
{
  auto channels = MemoryChannel::make_pair( CLIENT, SERVER );
  transfer( channels.first, channels.second, sample_data( 100000 ), quick_config() );
}

TEST( TCPSocket, TransferOverLossyChannel )
{
  auto channels = MemoryChannel::make_pair( CLIENT, SERVER );
  const LossProfile profile {
    .loss_rate = 0.1, .corrupt_rate = 0.05, .duplicate_rate = 0.05, .min_delay_ms = 0, .max_delay_ms = 5 };

  LossProfile client_profile = profile;
  client_profile.seed = 11;
  LossProfile server_profile = profile;
  server_profile.seed = 12;

  auto client_channel = make_shared<LossyChannel>( channels.first, client_profile );
  auto server_channel = make_shared<LossyChannel>( channels.second, server_profile );

  TCPSocket server { server_channel, quick_config() };
  TCPSocket client { client_channel, quick_config() };

  auto accepted = async( launch::async, [&server] { server.accept( 20s ); } );
  client.connect( SERVER, 20s );
  accepted.get();

  const string data = sample_data( 20000 );
  auto sent = async( launch::async, [&] {
    client.write( data, 30s );
    client.close();
  } );
  EXPECT_EQ( read_to_end( server, 60s ), data );
  sent.get();

  // the last acknowledgments may be lost, so only the state is checked, not the cause
  server.close();
  EXPECT_TRUE( server.wait_until_closed( 30s ) );
  EXPECT_TRUE( client.wait_until_closed( 30s ) );

  const auto stats = client.statistics();
  EXPECT_GE( stats.bytes_sent, data.size() );
  EXPECT_GT( client_channel->statistics().datagrams_lost + server_channel->statistics().datagrams_lost, 0U );
}

TEST( TCPSocket, TransferOverUDP )
{
  auto client_channel = make_shared<UDPChannel>( Address { "127.0.0.1", 0 } );
  auto server_channel = make_shared<UDPChannel>( Address { "127.0.0.1", 0 } );
  transfer( client_channel, server_channel, sample_data( 30000 ), quick_config() );
}

TEST( TCPSocket, ConnectTimesOutWithoutListener )
{
  auto channels = MemoryChannel::make_pair( CLIENT, SERVER );
  TCPConfig config = quick_config();
  TCPSocket client { channels.first, config };

  try {
    client.connect( SERVER, 300ms );
    FAIL() << "connected to nobody";
  } catch ( const ConnectionError& e ) {
    EXPECT_EQ( e.cause(), ConnectionError::Cause::TIMED_OUT );
  }
  EXPECT_EQ( client.state(), TCPState::CLOSED );
}

TEST( TCPSocket, AbortResetsPeer )
{
  auto channels = MemoryChannel::make_pair( CLIENT, SERVER );
  TCPSocket server { channels.second, quick_config() };
  TCPSocket client { channels.first, quick_config() };

  auto accepted = async( launch::async, [&server] { server.accept( 10s ); } );
  client.connect( SERVER, 10s );
  accepted.get();

  client.abort();
  EXPECT_TRUE( server.wait_until_closed( 5s ) );
  try {
    server.write( "anyone there?", 1s );
    FAIL() << "write on a reset connection succeeded";
  } catch ( const ConnectionError& e ) {
    EXPECT_EQ( e.cause(), ConnectionError::Cause::PEER_RESET );
  }
}
