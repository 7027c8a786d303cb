#include "tcp_socket.hh"
#include "debug.hh"
#include "exception.hh"

using namespace std;

TCPSocket::TCPSocket( shared_ptr<DatagramChannel> channel, const TCPConfig& config )
  : channel_( notnull( "TCPSocket", move( channel ) ) )
  , connection_( config, [this]( const Segment& segment ) { send_to_peer( segment ); } )
{
  receiver_thread_ = thread( [this] { receive_loop(); } );
  timer_thread_ = thread( [this] { timer_loop(); } );
}

TCPSocket::~TCPSocket()
{
  stopping_ = true;
  if ( receiver_thread_.joinable() ) {
    receiver_thread_.join();
  }
  if ( timer_thread_.joinable() ) {
    timer_thread_.join();
  }
}

void TCPSocket::connect( const Address& peer, const chrono::milliseconds timeout )
{
  {
    const lock_guard lock( peer_mutex_ );
    peer_ = peer;
  }
  connection_.connect();
  if ( not connection_.wait_until_established( timeout ) ) {
    connection_.abort();
    throw ConnectionError( ConnectionError::Cause::TIMED_OUT, "connect to " + peer.to_string() + " timed out" );
  }
}

void TCPSocket::accept( const chrono::milliseconds timeout )
{
  {
    const lock_guard lock( peer_mutex_ );
    listening_ = true;
  }
  connection_.listen();
  if ( not connection_.wait_until_established( timeout ) ) {
    throw ConnectionError( ConnectionError::Cause::TIMED_OUT, "no connection accepted" );
  }
}

void TCPSocket::write( const string_view data, const chrono::milliseconds timeout )
{
  connection_.write_all( data, timeout );
}

string TCPSocket::read( const uint64_t max_len, const chrono::milliseconds timeout )
{
  return connection_.read_some( max_len, timeout );
}

void TCPSocket::close()
{
  connection_.close();
}

optional<Address> TCPSocket::peer() const
{
  const lock_guard lock( peer_mutex_ );
  return peer_;
}

// Runs under the connection's mutex.
void TCPSocket::send_to_peer( const Segment& segment )
{
  const auto destination = peer();
  if ( not destination.has_value() ) {
    warn( "tcp socket: no peer to send ", segment.to_string(), " to" );
    return;
  }

  try {
    channel_->send_datagram( *destination, segment.serialize() );
  } catch ( const unix_error& e ) {
    // the segment is lost as far as the protocol is concerned; retransmission covers it
    warn( "tcp socket: send to ", destination->to_string(), " failed: ", e.what() );
  }
}

void TCPSocket::receive_loop()
{
  while ( not stopping_ ) {
    auto datagram = channel_->receive_datagram( RECEIVE_POLL );
    if ( not datagram.has_value() ) {
      continue;
    }

    {
      const lock_guard lock( peer_mutex_ );
      if ( not peer_.has_value() ) {
        Segment segment;
        if ( not listening_ or not parse( segment, datagram->payload ) or segment.kind() != Segment::Kind::SYN
             or segment.is_corrupt() ) {
          continue;
        }
        debug( "tcp socket: accepting connection from ", datagram->peer.to_string() );
        peer_ = datagram->peer;
      } else if ( datagram->peer != *peer_ ) {
        continue;
      }
    }

    connection_.receive_datagram( datagram->payload );
  }
}

void TCPSocket::timer_loop()
{
  auto last = chrono::steady_clock::now();
  while ( not stopping_ ) {
    this_thread::sleep_for( TICK_INTERVAL );
    const auto now = chrono::steady_clock::now();
    const auto elapsed = chrono::duration_cast<chrono::milliseconds>( now - last );
    if ( elapsed.count() > 0 ) {
      connection_.tick( elapsed.count() );
      last += elapsed;
    }
  }
}
