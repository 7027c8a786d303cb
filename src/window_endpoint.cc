#include "window_endpoint.hh"
#include "debug.hh"
#include "exception.hh"

using namespace std;

WindowSenderEndpoint::WindowSenderEndpoint( shared_ptr<DatagramChannel> channel,
                                            const Address& peer,
                                            const WindowConfig& config )
  : channel_( notnull( "WindowSenderEndpoint", move( channel ) ) )
  , peer_( peer )
  , sender_( config, [this]( const Segment& segment ) {
    try {
      channel_->send_datagram( peer_, segment.serialize() );
    } catch ( const unix_error& e ) {
      warn( "window sender: send to ", peer_.to_string(), " failed: ", e.what() );
    }
  } )
{
  receiver_thread_ = thread( [this] { receive_loop(); } );
  timer_thread_ = thread( [this] { timer_loop(); } );
}

WindowSenderEndpoint::~WindowSenderEndpoint()
{
  stop();
}

void WindowSenderEndpoint::stop()
{
  stopping_ = true;
  if ( receiver_thread_.joinable() ) {
    receiver_thread_.join();
  }
  if ( timer_thread_.joinable() ) {
    timer_thread_.join();
  }
}

void WindowSenderEndpoint::receive_loop()
{
  while ( not stopping_ ) {
    auto datagram = channel_->receive_datagram( RECEIVE_POLL );
    if ( not datagram.has_value() ) {
      continue;
    }
    if ( datagram->peer != peer_ ) {
      debug( "window sender: ignoring datagram from ", datagram->peer.to_string() );
      continue;
    }
    sender_.receive_datagram( datagram->payload );
  }
}

void WindowSenderEndpoint::timer_loop()
{
  auto last = chrono::steady_clock::now();
  while ( not stopping_ ) {
    this_thread::sleep_for( TICK_INTERVAL );
    const auto now = chrono::steady_clock::now();
    const auto elapsed = chrono::duration_cast<chrono::milliseconds>( now - last );
    if ( elapsed.count() > 0 ) {
      sender_.tick( elapsed.count() );
      last += elapsed;
    }
  }
}

WindowReceiverEndpoint::WindowReceiverEndpoint( shared_ptr<DatagramChannel> channel, const WindowConfig& config )
  : channel_( notnull( "WindowReceiverEndpoint", move( channel ) ) )
  , receiver_( config, [this]( const Segment& ack ) { send_ack( ack ); } )
{
  receiver_thread_ = thread( [this] { receive_loop(); } );
}

WindowReceiverEndpoint::~WindowReceiverEndpoint()
{
  stop();
}

void WindowReceiverEndpoint::stop()
{
  stopping_ = true;
  if ( receiver_thread_.joinable() ) {
    receiver_thread_.join();
  }
}

optional<Address> WindowReceiverEndpoint::peer() const
{
  const lock_guard lock( peer_mutex_ );
  return peer_;
}

// Runs on the receive thread, inside WindowReceiver::receive_datagram().
void WindowReceiverEndpoint::send_ack( const Segment& ack )
{
  const auto destination = peer();
  if ( not destination.has_value() ) {
    return;
  }

  try {
    channel_->send_datagram( *destination, ack.serialize() );
  } catch ( const unix_error& e ) {
    warn( "window receiver: ack to ", destination->to_string(), " failed: ", e.what() );
  }
}

void WindowReceiverEndpoint::receive_loop()
{
  while ( not stopping_ ) {
    auto datagram = channel_->receive_datagram( RECEIVE_POLL );
    if ( not datagram.has_value() ) {
      continue;
    }

    {
      const lock_guard lock( peer_mutex_ );
      if ( not peer_.has_value() or *peer_ != datagram->peer ) {
        debug( "window receiver: data from ", datagram->peer.to_string() );
        peer_ = datagram->peer;
      }
    }
    receiver_.receive_datagram( datagram->payload );
  }
}

optional<string> WindowReceiverEndpoint::receive( const chrono::milliseconds timeout )
{
  if ( not receiver_.wait_for_delivered( taken_ + 1, timeout ) ) {
    return nullopt;
  }
  auto unit = receiver_.pop();
  if ( unit.has_value() ) {
    taken_++;
  }
  return unit;
}

vector<string> WindowReceiverEndpoint::receive_all( const uint64_t count, const chrono::milliseconds timeout )
{
  receiver_.wait_for_delivered( count, timeout );
  auto units = receiver_.take_delivered();
  taken_ += units.size();
  return units;
}
