#include "window_receiver.hh"
#include "debug.hh"

using namespace std;

namespace {
const Wrap32 ZERO_POINT { 0 };
} // namespace

WindowReceiver::WindowReceiver( const WindowConfig& config, TransmitFunction transmit )
  : config_( config ), transmit_( move( transmit ) )
{
  config_.validate();
  if ( not transmit_ ) {
    throw invalid_argument( "WindowReceiver: missing transmit function" );
  }
}

void WindowReceiver::receive_datagram( const string_view bytes )
{
  Segment segment;
  if ( not parse( segment, bytes ) ) {
    const lock_guard lock( mutex_ );
    stats_.malformed++;
    debug( "window receiver: dropped ", to_string( DropReason::MALFORMED ), " datagram of ", bytes.size(), " bytes" );
    return;
  }
  receive( segment );
}

void WindowReceiver::receive( const Segment& segment )
{
  const lock_guard lock( mutex_ );
  stats_.units_received++;

  if ( segment.is_corrupt() ) {
    stats_.corrupt++;
    drop( DropReason::CORRUPT, segment );
    // repeat the last good acknowledgment as negative feedback
    if ( config_.policy == AckPolicy::CUMULATIVE and expected_ > 0 ) {
      send_ack( expected_ - 1 );
    }
    return;
  }

  if ( segment.kind() != Segment::Kind::DATA ) {
    drop( DropReason::ILLEGAL_STATE, segment );
    return;
  }

  const uint64_t seqno = segment.seqno.unwrap( ZERO_POINT, expected_ );
  if ( config_.policy == AckPolicy::CUMULATIVE ) {
    receive_cumulative( seqno, segment.payload );
  } else {
    receive_selective( seqno, segment.payload );
  }
}

void WindowReceiver::receive_cumulative( const uint64_t seqno, string payload )
{
  if ( seqno == expected_ ) {
    deliver( move( payload ) );
    expected_++;
    send_ack( expected_ - 1 );
    return;
  }

  if ( seqno < expected_ ) {
    stats_.duplicates++;
  } else {
    stats_.out_of_window++;
  }
  debug( "window receiver: expected ", expected_, ", discarding unit ", seqno );

  // duplicate feedback; nothing to repeat before the first delivery
  if ( expected_ > 0 ) {
    send_ack( expected_ - 1 );
  }
}

void WindowReceiver::receive_selective( const uint64_t seqno, string payload )
{
  if ( seqno < expected_ ) {
    // already delivered; its acknowledgment may have been lost, so repeat it
    stats_.duplicates++;
    if ( seqno + config_.window_size >= expected_ ) {
      send_ack( seqno );
    }
    return;
  }

  // the sender never runs this far ahead of us unless our acks are far behind
  if ( seqno >= expected_ + config_.window_size ) {
    stats_.out_of_window++;
    debug( "window receiver: unit ", seqno, " beyond window [", expected_, ", ", expected_ + config_.window_size, ")" );
    return;
  }

  send_ack( seqno ); // every in-window unit is acknowledged individually, even a repeat

  if ( seqno != expected_ ) {
    if ( reorder_buffer_.contains( seqno ) ) {
      stats_.duplicates++;
    } else {
      reorder_buffer_.emplace( seqno, move( payload ) );
      stats_.units_buffered++;
    }
    return;
  }

  deliver( move( payload ) );
  expected_++;

  // release the contiguous run that was waiting behind the gap
  auto it = reorder_buffer_.begin();
  while ( it != reorder_buffer_.end() and it->first <= expected_ ) {
    if ( it->first == expected_ ) {
      deliver( move( it->second ) );
      expected_++;
    }
    it = reorder_buffer_.erase( it );
  }
}

void WindowReceiver::deliver( string payload )
{
  delivered_.push_back( move( payload ) );
  stats_.units_delivered++;
  delivered_cv_.notify_all();
}

void WindowReceiver::send_ack( const uint64_t seqno )
{
  Segment ack;
  ack.flags = Segment::FLAG_ACK;
  ack.ackno = Wrap32::wrap( seqno, ZERO_POINT );
  ack.seal();
  transmit_( ack );
  stats_.acks_sent++;
}

void WindowReceiver::drop( const DropReason reason, const Segment& segment )
{
  debug( "window receiver: dropped ", to_string( reason ), " ", segment.to_string() );
}

optional<string> WindowReceiver::pop()
{
  const lock_guard lock( mutex_ );
  if ( delivered_.empty() ) {
    return nullopt;
  }
  string front = move( delivered_.front() );
  delivered_.pop_front();
  return front;
}

vector<string> WindowReceiver::take_delivered()
{
  const lock_guard lock( mutex_ );
  vector<string> out( make_move_iterator( delivered_.begin() ), make_move_iterator( delivered_.end() ) );
  delivered_.clear();
  return out;
}

bool WindowReceiver::wait_for_delivered( const uint64_t count, const chrono::milliseconds timeout )
{
  unique_lock lock( mutex_ );
  return delivered_cv_.wait_for( lock, timeout, [this, count] { return stats_.units_delivered >= count; } );
}

uint64_t WindowReceiver::expected() const
{
  const lock_guard lock( mutex_ );
  return expected_;
}

size_t WindowReceiver::buffered() const
{
  const lock_guard lock( mutex_ );
  return reorder_buffer_.size();
}

WindowReceiver::Statistics WindowReceiver::statistics() const
{
  const lock_guard lock( mutex_ );
  return stats_;
}
