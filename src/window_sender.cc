#include "window_sender.hh"
#include "connection_error.hh"
#include "debug.hh"

using namespace std;

namespace {
const Wrap32 ZERO_POINT { 0 };
} // namespace

WindowSender::WindowSender( const WindowConfig& config, TransmitFunction transmit )
  : config_( config ), transmit_( move( transmit ) )
{
  config_.validate();
  if ( not transmit_ ) {
    throw invalid_argument( "WindowSender: missing transmit function" );
  }
}

WindowSender::~WindowSender()
{
  const lock_guard lock( mutex_ );
  timers_.cancel_all();
}

void WindowSender::check_error() const
{
  if ( error_ ) {
    throw ConnectionError( ConnectionError::Cause::RETRANSMISSION_LIMIT,
                           "unit " + to_string( base_ ) + " was never acknowledged" );
  }
}

bool WindowSender::try_send( string payload )
{
  const lock_guard lock( mutex_ );
  check_error();
  if ( not window_open() ) {
    return false;
  }
  send_unit( move( payload ) );
  return true;
}

void WindowSender::send( string payload, const chrono::milliseconds timeout )
{
  unique_lock lock( mutex_ );
  const bool ready = window_changed_.wait_for( lock, timeout, [this] { return error_ or window_open(); } );
  check_error();
  if ( not ready ) {
    throw ConnectionError( ConnectionError::Cause::TIMED_OUT, "window stayed full" );
  }
  send_unit( move( payload ) );
}

void WindowSender::send_unit( string payload )
{
  Segment segment;
  segment.seqno = Wrap32::wrap( next_seqno_, ZERO_POINT );
  segment.payload = move( payload );
  segment.seal();

  // a unit takes exactly one sequence number
  OutstandingUnit unit { .seqno = next_seqno_, .length = 1, .segment = move( segment ), .sent_at = timers_.now() };
  transmit_( unit.segment );
  debug( "window sender: sent ", unit.segment.to_string() );

  const uint64_t seqno = next_seqno_;
  outstanding_.push( move( unit ) );
  next_seqno_++;
  stats_.units_sent++;

  arm_timer( seqno );
}

void WindowSender::arm_timer( const uint64_t seqno )
{
  if ( config_.policy == AckPolicy::CUMULATIVE ) {
    // one timer, tracking the oldest outstanding unit
    if ( not timers_.running( WINDOW_TIMER ) ) {
      timers_.start( WINDOW_TIMER, config_.rto_ms, [this] { on_timeout( WINDOW_TIMER ); } );
    }
    return;
  }

  timers_.start( seqno, config_.rto_ms, [this, seqno] { on_timeout( seqno ); } );
}

void WindowSender::receive_datagram( const string_view bytes )
{
  Segment segment;
  if ( not parse( segment, bytes ) ) {
    const lock_guard lock( mutex_ );
    stats_.malformed++;
    return;
  }
  receive( segment );
}

void WindowSender::receive( const Segment& ack )
{
  const lock_guard lock( mutex_ );
  if ( ack.is_corrupt() ) {
    stats_.corrupt++;
    debug( "window sender: dropped ", to_string( DropReason::CORRUPT ), " acknowledgment" );
    return;
  }
  if ( error_ or not ack.has( Segment::FLAG_ACK ) ) {
    return;
  }

  // acknowledgments name the unit itself, not the next one expected
  const uint64_t acked = ack.ackno.unwrap( ZERO_POINT, base_ );
  if ( acked >= next_seqno_ ) {
    stats_.ignored_acks++;
    return;
  }

  stats_.acks_received++;
  if ( config_.policy == AckPolicy::CUMULATIVE ) {
    receive_cumulative( acked );
  } else {
    receive_selective( acked );
  }
}

void WindowSender::receive_cumulative( const uint64_t acked )
{
  const uint64_t new_base = acked + 1;

  if ( new_base <= base_ ) {
    stats_.duplicate_acks++;
    duplicate_ack_run_++;
    if ( config_.duplicate_ack_threshold > 0 and duplicate_ack_run_ == config_.duplicate_ack_threshold ) {
      debug( "window sender: ", duplicate_ack_run_, " duplicate acks for ", acked, ", resending window" );
      retransmit_window( Cause::FEEDBACK );
    }
    return;
  }

  outstanding_.acknowledge_through( new_base );
  base_ = new_base;
  duplicate_ack_run_ = 0;

  // the timer now follows the new oldest unit, from a full RTO

  if ( base_ == next_seqno_ ) {
    timers_.cancel( WINDOW_TIMER );
  } else {
    timers_.start( WINDOW_TIMER, config_.rto_ms, [this] { on_timeout( WINDOW_TIMER ); } );
  }
  window_changed_.notify_all();
}

void WindowSender::receive_selective( const uint64_t acked )
{
  if ( acked < base_ or not outstanding_.acknowledge_exactly( acked ) ) {
    stats_.duplicate_acks++;
    return;
  }
  timers_.cancel( acked );

  // an acknowledgment that skips the oldest unit hints that the oldest unit was lost
  auto* oldest = outstanding_.oldest();
  if ( oldest and oldest->seqno < acked and not oldest->acknowledged ) {
    oldest->loss_signals++;
    if ( config_.duplicate_ack_threshold > 0 and oldest->loss_signals == config_.duplicate_ack_threshold ) {
      retransmit( *oldest, Cause::FEEDBACK );
      timers_.start(
        oldest->seqno, config_.rto_ms, [this, seqno = oldest->seqno] { on_timeout( seqno ); } );
    }
  }

  // slide the base past every acknowledged unit at the front
  outstanding_.release_acknowledged_prefix();
  const auto* front = outstanding_.oldest();
  base_ = front ? front->seqno : next_seqno_;
  window_changed_.notify_all();
}

void WindowSender::retransmit( OutstandingUnit& unit, const Cause cause )
{
  transmit_( unit.segment );
  if ( cause == Cause::TIMEOUT ) {
    stats_.timeout_retransmissions++;
  } else {
    stats_.feedback_retransmissions++;
  }
  debug( "window sender: retransmit ",
         unit.segment.to_string(),
         cause == Cause::TIMEOUT ? " (timeout)" : " (duplicate feedback)" );
}

void WindowSender::retransmit_window( const Cause cause )
{
  for ( auto& [seqno, unit] : outstanding_ ) {
    if ( not unit.acknowledged ) {
      retransmit( unit, cause );
    }
  }
}

void WindowSender::on_timeout( const TimerService::Key key )
{
  if ( error_ ) {
    return;
  }

  // the cumulative timer belongs to whichever unit is oldest now
  OutstandingUnit* unit = config_.policy == AckPolicy::CUMULATIVE ? outstanding_.oldest() : outstanding_.find( key );
  if ( unit == nullptr or unit->acknowledged ) {
    return;
  }

  stats_.timeouts++;
  unit->retransmissions++;
  // the limit counts resends of one unit, not of the window
  if ( unit->retransmissions > config_.max_retransmissions ) {
    fail( unit->seqno );
    return;
  }

  if ( config_.policy == AckPolicy::CUMULATIVE ) {
    debug( "window sender: timeout, resending [", base_, ", ", next_seqno_, ")" );
    retransmit_window( Cause::TIMEOUT );
  } else {
    debug( "window sender: timeout for unit ", key );
    retransmit( *unit, Cause::TIMEOUT );
  }
  timers_.restart( key, config_.rto_ms );
}

void WindowSender::fail( const uint64_t seqno )
{
  warn( "window sender: unit ",
        seqno,
        " retransmitted ",
        config_.max_retransmissions,
        " times without acknowledgment, giving up" );
  error_ = true;
  timers_.cancel_all();
  window_changed_.notify_all();
}

bool WindowSender::wait_until_drained( const chrono::milliseconds timeout )
{
  unique_lock lock( mutex_ );
  window_changed_.wait_for( lock, timeout, [this] { return error_ or base_ == next_seqno_; } );
  return not error_ and base_ == next_seqno_;
}

uint64_t WindowSender::base() const
{
  const lock_guard lock( mutex_ );
  return base_;
}

uint64_t WindowSender::next_seqno() const
{
  const lock_guard lock( mutex_ );
  return next_seqno_;
}

uint64_t WindowSender::units_in_flight() const
{
  const lock_guard lock( mutex_ );
  return outstanding_.sequence_numbers_in_flight();
}

bool WindowSender::has_error() const
{
  const lock_guard lock( mutex_ );
  return error_;
}

WindowSender::Statistics WindowSender::statistics() const
{
  const lock_guard lock( mutex_ );
  return stats_;
}
