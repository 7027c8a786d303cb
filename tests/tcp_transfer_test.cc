#include "test_harness.hh"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace std;

namespace {

string pattern( size_t length )
{
  string data;
  for ( size_t i = 0; i < length; i++ ) {
    data.push_back( static_cast<char>( 'a' + i % 26 ) );
  }
  return data;
}

// Read everything the server has, until `length` bytes arrived or nothing moves any more.
string receive_all( ConnectionPair& pair, size_t length, size_t chunk = UINT64_MAX )
{
  string received;
  for ( int round = 0; round < 1000 and received.size() < length; round++ ) {
    pair.exchange();
    received += pair.server->read( chunk );
  }
  return received;
}

} // namespace

TEST( TCPTransfer, SmallWriteArrives )
{
  ConnectionPair pair;
  pair.handshake();

  EXPECT_EQ( pair.client->write( "hello" ), 5U );
  ASSERT_EQ( pair.to_server.size(), 1U );
  EXPECT_EQ( pair.to_server.front().payload, "hello" );
  EXPECT_EQ( pair.to_server.front().seqno, Wrap32 { 1001 } );
  EXPECT_EQ( pair.client->bytes_in_flight(), 5U );

  pair.exchange();
  EXPECT_EQ( pair.server->read( 100 ), "hello" );
  EXPECT_EQ( pair.client->bytes_in_flight(), 0U );
  EXPECT_EQ( pair.server->statistics().bytes_delivered, 5U );
}

TEST( TCPTransfer, LargeWriteIsCutAtMss )
{
  ConnectionPair pair;
  pair.handshake();

  const string data = pattern( 3500 );
  EXPECT_EQ( pair.client->write( data ), data.size() );

  vector<size_t> sizes;
  for ( const auto& segment : pair.to_server.take() ) {
    sizes.push_back( segment.payload.size() );
    pair.server->receive( segment );
  }
  EXPECT_EQ( sizes, ( vector<size_t> { 1000, 1000, 1000, 500 } ) );
  EXPECT_EQ( pair.server->read( UINT64_MAX ), data );
}

TEST( TCPTransfer, BothDirectionsAtOnce )
{
  ConnectionPair pair;
  pair.handshake();
  pair.client->write( "from client" );
  pair.server->write( "from server" );
  pair.exchange();
  EXPECT_EQ( pair.server->read( 100 ), "from client" );
  EXPECT_EQ( pair.client->read( 100 ), "from server" );
}

TEST( TCPTransfer, SequenceNumbersWrap )
{
  ConnectionPair pair; // the server's ISN is 16 below 2^32
  pair.handshake();
  const string data = pattern( 100 );
  pair.server->write( data );
  pair.exchange();
  EXPECT_EQ( pair.client->read( UINT64_MAX ), data );
  EXPECT_EQ( pair.server->bytes_in_flight(), 0U );
}

// receiver window 1024, 5120 bytes written
TEST( TCPTransfer, UnacknowledgedBytesNeverExceedPeerWindow )
{
  TCPConfig server_config;
  server_config.recv_capacity = 1024;
  ConnectionPair pair { {}, server_config };
  pair.handshake();

  const string data = pattern( 5120 );
  EXPECT_EQ( pair.client->write( data ), data.size() );

  uint64_t peak = 0;
  string received;
  for ( int round = 0; round < 1000 and received.size() < data.size(); round++ ) {
    pair.exchange( [&]( const Segment& ) {
      const uint64_t in_flight = pair.client->bytes_in_flight();
      EXPECT_LE( in_flight, 1024U );
      EXPECT_LE( in_flight, pair.client->peer_window() );
      peak = max( peak, in_flight );
      return true;
    } );
    received += pair.server->read( 300 );
  }

  EXPECT_EQ( received, data );
  EXPECT_EQ( peak, 1024U );
}

TEST( TCPTransfer, LostSegmentResendsOutstandingData )
{
  ConnectionPair pair;
  pair.handshake();

  const string data = pattern( 3000 );
  pair.client->write( data );

  auto sent = pair.to_server.take();
  ASSERT_EQ( sent.size(), 3U );
  pair.server->receive( sent[0] );
  pair.server->receive( sent[2] ); // the middle one is lost
  EXPECT_EQ( pair.server->statistics().duplicate, 0U );
  pair.exchange();
  EXPECT_EQ( pair.client->bytes_in_flight(), 2000U );

  ConnectionPair::expire_rto( *pair.client );
  EXPECT_EQ( pair.to_server.size(), 2U );
  EXPECT_EQ( pair.client->statistics().timeout_retransmissions, 2U );

  EXPECT_EQ( receive_all( pair, data.size() ), data );
  EXPECT_EQ( pair.client->bytes_in_flight(), 0U );
  EXPECT_EQ( pair.server->statistics().duplicate, 1U ); // the third segment, twice
}

TEST( TCPTransfer, DuplicatedAndReorderedSegmentsDeliverOnce )
{
  ConnectionPair pair;
  pair.handshake();

  const string data = pattern( 4000 );
  pair.client->write( data );
  auto sent = pair.to_server.take();
  ASSERT_EQ( sent.size(), 4U );

  for ( const size_t i : { 3, 1, 1, 0, 3, 2, 0, 2 } ) {
    pair.server->receive( sent[i] );
  }
  EXPECT_EQ( pair.server->read( UINT64_MAX ), data );
  EXPECT_EQ( pair.server->read( UINT64_MAX ), "" );
}

TEST( TCPTransfer, CorruptSegmentIsNeverDelivered )
{
  ConnectionPair pair;
  pair.handshake();
  pair.client->write( "secret" );

  string bytes = pair.to_server.pop().serialize();
  bytes.back() = static_cast<char>( bytes.back() ^ 0x20 );
  pair.server->receive_datagram( bytes );
  EXPECT_EQ( pair.server->read( 100 ), "" );
  EXPECT_EQ( pair.server->statistics().corrupt, 1U );

  ConnectionPair::expire_rto( *pair.client );
  pair.exchange();
  EXPECT_EQ( pair.server->read( 100 ), "secret" );
}

TEST( TCPTransfer, MalformedDatagramIsDropped )
{
  ConnectionPair pair;
  pair.handshake();
  pair.server->receive_datagram( "short" );
  EXPECT_EQ( pair.server->statistics().malformed, 1U );
  EXPECT_EQ( pair.server->state(), TCPState::ESTABLISHED );
}

TEST( TCPTransfer, ZeroWindowIsRetriedByPersistTimer )
{
  TCPConfig server_config;
  server_config.recv_capacity = 1000;
  ConnectionPair pair { {}, server_config };
  pair.handshake();

  const string data = pattern( 2000 );
  pair.client->write( data );
  pair.exchange();
  EXPECT_EQ( pair.client->peer_window(), 0 );
  EXPECT_EQ( pair.client->bytes_in_flight(), 0U );

  // the window update is lost
  string received = pair.server->read( UINT64_MAX );
  EXPECT_EQ( received.size(), 1000U );
  ASSERT_EQ( pair.to_client.size(), 1U );
  pair.to_client.clear();

  ConnectionPair::expire_rto( *pair.client );
  ASSERT_EQ( pair.to_server.size(), 1U );
  EXPECT_TRUE( pair.to_server.front().payload.empty() );
  EXPECT_EQ( pair.client->bytes_in_flight(), 0U );
  EXPECT_EQ( pair.client->statistics().persist_segments, 1U );

  received += receive_all( pair, 1000 );
  EXPECT_EQ( received, data );
}

TEST( TCPTransfer, AnsweredPersistSegmentsKeepConnectionAlive )
{
  TCPConfig server_config;
  server_config.recv_capacity = 1000;
  ConnectionPair pair { {}, server_config };
  pair.handshake();

  pair.client->write( pattern( 3000 ) );
  pair.exchange();

  for ( int i = 0; i < 50; i++ ) {
    pair.tick( TCPConfig::MAX_TIMEOUT );
    pair.exchange();
  }
  EXPECT_EQ( pair.client->state(), TCPState::ESTABLISHED );
  EXPECT_FALSE( pair.client->has_error() );
  EXPECT_GE( pair.client->statistics().persist_segments, 50U );

  EXPECT_EQ( receive_all( pair, 3000 ).size(), 3000U );
}

TEST( TCPTransfer, VanishedPeerBehindZeroWindowIsAbandoned )
{
  TCPConfig server_config;
  server_config.recv_capacity = 1000;
  ConnectionPair pair { {}, server_config };
  pair.handshake();

  pair.client->write( pattern( 3000 ) );
  pair.exchange();
  ASSERT_EQ( pair.client->peer_window(), 0 );

  // from here on nothing the client sends gets an answer
  for ( uint64_t i = 0; i < TCPConfig::MAX_RETX_ATTEMPTS; i++ ) {
    pair.client->tick( TCPConfig::MAX_TIMEOUT );
    EXPECT_EQ( pair.client->state(), TCPState::ESTABLISHED );
    EXPECT_EQ( pair.to_server.size(), 1U );
    pair.to_server.clear();
  }
  EXPECT_EQ( pair.client->statistics().persist_segments, TCPConfig::MAX_RETX_ATTEMPTS );

  pair.client->tick( TCPConfig::MAX_TIMEOUT );
  EXPECT_EQ( pair.client->state(), TCPState::CLOSED );
  EXPECT_EQ( pair.client->error_cause(), ConnectionError::Cause::RETRANSMISSION_LIMIT );
  ASSERT_EQ( pair.to_server.size(), 1U );
  EXPECT_EQ( pair.to_server.front().kind(), Segment::Kind::RST );
}

TEST( TCPTransfer, FlushedOnceEverythingIsAcknowledged )
{
  ConnectionPair pair;
  pair.handshake();
  EXPECT_TRUE( pair.client->wait_until_flushed( chrono::milliseconds { 0 } ) );

  pair.client->write( pattern( 1500 ) );
  EXPECT_FALSE( pair.client->wait_until_flushed( chrono::milliseconds { 0 } ) );

  pair.exchange();
  EXPECT_TRUE( pair.client->wait_until_flushed( chrono::milliseconds { 0 } ) );
}

TEST( TCPTransfer, PeerResetAbortsConnection )
{
  ConnectionPair pair;
  pair.handshake();
  pair.client->abort();
  EXPECT_EQ( pair.client->state(), TCPState::CLOSED );
  ASSERT_EQ( pair.to_server.size(), 1U );
  EXPECT_EQ( pair.to_server.front().kind(), Segment::Kind::RST );

  pair.exchange();
  EXPECT_EQ( pair.server->state(), TCPState::CLOSED );
  EXPECT_EQ( pair.server->error_cause(), ConnectionError::Cause::PEER_RESET );
  EXPECT_THROW( pair.server->read( 10 ), ConnectionError );
}

TEST( TCPTransfer, ResetOutsideWindowIsIgnored )
{
  ConnectionPair pair;
  pair.handshake();

  Segment forged;
  forged.flags = Segment::FLAG_RST;
  forged.seqno = Wrap32 { 1000 + 50000 };
  forged.seal();
  pair.server->receive( forged );

  EXPECT_EQ( pair.server->state(), TCPState::ESTABLISHED );
  EXPECT_FALSE( pair.server->has_error() );
}

TEST( TCPTransfer, AcknowledgmentOfUnsentDataIsAnswered )
{
  ConnectionPair pair;
  pair.handshake();

  Segment bogus;
  bogus.flags = Segment::FLAG_ACK;
  bogus.seqno = Wrap32 { 1001 };
  bogus.ackno = Wrap32 { 0xFFFFFFF1 + 500 };
  bogus.window = 1000;
  bogus.seal();
  pair.server->receive( bogus );

  EXPECT_EQ( pair.server->bytes_in_flight(), 0U );
  ASSERT_EQ( pair.to_client.size(), 1U );
  EXPECT_EQ( pair.to_client.front().kind(), Segment::Kind::ACK );
}
