#include "tcp_sender.hh"
#include "debug.hh"

#include <algorithm>

using namespace std;

TCPSender::TCPSender( ByteStream&& input,
                      Wrap32 isn,
                      const TCPConfig& config,
                      TimerService& timers,
                      TransmitFunction transmit,
                      GiveUpFunction give_up )
  : input_( move( input ) )
  , isn_( isn )
  , mss_( config.mss )
  , send_window_cap_( config.send_window_cap )
  , max_retransmissions_( config.max_retransmissions )
  , timers_( timers )
  , transmit_( move( transmit ) )
  , give_up_( move( give_up ) )
  , rtt_( config.initial_rto_ms, config.min_rto_ms, config.max_rto_ms )
{}

// Sequence numbers we may still put in flight: the smaller of our cap and the peer's window,
// less what is already outstanding.
uint64_t TCPSender::window_room() const
{
  const uint64_t window = min<uint64_t>( send_window_cap_, peer_window_ );
  const uint64_t in_flight = sequence_numbers_in_flight();
  return in_flight >= window ? 0 : window - in_flight;
}

// Anything left to send that the window is holding back (data, or a FIN not yet sent)
bool TCPSender::has_pending_data() const
{
  return reader().bytes_buffered() > 0 or ( writer().is_closed() and not fin_sent_ );
}

void TCPSender::push()
{
  if ( input_.has_error() or fin_sent_ ) {
    return;
  }

  // the SYN goes alone and first; data waits for its acknowledgment
  if ( not syn_sent_ ) {
    Segment syn = make_empty_segment();
    syn.flags |= Segment::FLAG_SYN;
    syn_sent_ = true;
    send_segment( move( syn ) );
    return;
  }

  // no data until the handshake completes
  if ( not syn_acked() ) {
    return;
  }

  while ( not fin_sent_ ) {
    const uint64_t room = window_room();
    if ( room == 0 ) {
      break;
    }

    Segment segment = make_empty_segment();
    read( reader(), min<uint64_t>( room, mss_ ), segment.payload ); // at most one MSS, at most the room

    // FIN occupies a sequence number, so it needs room of its own
    if ( reader().is_finished() and segment.payload.size() < room ) {
      segment.flags |= Segment::FLAG_FIN;
      fin_sent_ = true;
    }

    if ( segment.sequence_length() == 0 ) {
      break; // nothing buffered and no FIN due
    }
    send_segment( move( segment ) );
  }

  // A closed window with data waiting: nobody else will ask the peer to reopen it.
  if ( peer_window_ == 0 and outstanding_.empty() and has_pending_data()
       and not timers_.running( PERSIST_TIMER ) ) {
    timers_.start( PERSIST_TIMER, rtt_.rto_ms(), [this] { on_persist_timeout(); } );
  }
}

void TCPSender::send_segment( Segment segment )
{
  const uint64_t length = segment.sequence_length();
  stats_.segments_sent++;
  stats_.bytes_sent += segment.payload.size();

  OutstandingUnit unit {
    .seqno = next_seqno_, .length = length, .segment = move( segment ), .sent_at = timers_.now() };
  transmit_( unit.segment );
  next_seqno_ += length;
  outstanding_.push( move( unit ) ); // kept until the cumulative ack passes its last seqno

  // one timer for the whole queue, running while anything is outstanding
  if ( not timers_.running( RETRANSMISSION_TIMER ) ) {
    timers_.start( RETRANSMISSION_TIMER, rtt_.rto_ms(), [this] { on_retransmission_timeout(); } );
  }
}

Segment TCPSender::make_empty_segment() const
{
  Segment segment;
  segment.seqno = Wrap32::wrap( next_seqno_, isn_ );
  if ( input_.has_error() ) {
    segment.flags |= Segment::FLAG_RST; // every segment of a failed stream is a reset
  }
  return segment;
}

bool TCPSender::receive( const Segment& segment )
{
  if ( input_.has_error() or not segment.has( Segment::FLAG_ACK ) ) {
    return true;
  }

  const uint64_t ackno = segment.ackno.unwrap( isn_, next_seqno_ );
  // acknowledges data we never sent
  if ( ackno > next_seqno_ ) {
    stats_.ignored_acks++;
    return false;
  }

  // a stale acknowledgment carries a stale window too
  if ( ackno < acked_ ) {
    return true;
  }

  // an answer while the window is (or was) closed shows the peer is alive
  if ( peer_window_ == 0 or segment.window == 0 ) {
    consecutive_retransmissions_ = 0;
  }
  peer_window_ = segment.window;
  if ( peer_window_ > 0 ) {
    timers_.cancel( PERSIST_TIMER );
  }

  if ( ackno == acked_ ) {
    return true; // window update only
  }
  acked_ = ackno;

  const auto covered = outstanding_.acknowledge_through( ackno );
  if ( covered.empty() ) {
    return true; // only part of the oldest segment
  }

  // Karn: an acknowledgment for a retransmitted segment is ambiguous, so it yields no sample
  const auto& newest = covered.back();
  if ( newest.retransmissions == 0 ) {
    rtt_.add_sample( timers_.now() - newest.sent_at );
    debug( "tcp sender: rtt sample ",
           timers_.now() - newest.sent_at,
           " ms, rto now ",
           rtt_.rto_ms(),
           " ms" );
  }
  consecutive_retransmissions_ = 0;

  // new data acknowledged: the timer restarts from now with the fresh RTO
  if ( outstanding_.empty() ) {
    timers_.cancel( RETRANSMISSION_TIMER );
  } else {
    timers_.start( RETRANSMISSION_TIMER, rtt_.rto_ms(), [this] { on_retransmission_timeout(); } );
  }
  return true;
}

// One more unanswered transmission. Returns false once the peer has been given up on.
bool TCPSender::count_retry()
{
  consecutive_retransmissions_++;
  if ( consecutive_retransmissions_ > max_retransmissions_ ) {
    warn( "tcp sender: no answer after ", max_retransmissions_, " retransmissions, giving up" );
    give_up_();
    return false;
  }
  rtt_.back_off();
  return true;
}

void TCPSender::on_retransmission_timeout()
{
  if ( outstanding_.empty() or input_.has_error() ) {
    return;
  }

  stats_.timeouts++;
  if ( not count_retry() ) {
    return;
  }

  debug( "tcp sender: timeout, resending [",
         acked_,
         ", ",
         next_seqno_,
         ") with rto ",
         rtt_.rto_ms(),
         " ms" );
  // go back over the whole queue; each resent segment is now useless for RTT samples
  for ( auto& [seqno, unit] : outstanding_ ) {
    unit.retransmissions++;
    stats_.timeout_retransmissions++;
    transmit_( unit.segment );
  }

  timers_.start( RETRANSMISSION_TIMER, rtt_.rto_ms(), [this] { on_retransmission_timeout(); } );
}

void TCPSender::on_persist_timeout()
{
  // the window opened, data went out, or there is nothing left to send
  if ( peer_window_ > 0 or not outstanding_.empty() or not has_pending_data() or input_.has_error() ) {
    return;
  }
  if ( not count_retry() ) {
    return;
  }

  // Already-acknowledged seqno: the receiver answers it with its current window.
  Segment query;
  query.seqno = Wrap32::wrap( next_seqno_ - 1, isn_ );
  stats_.persist_segments++;
  debug( "tcp sender: zero window, asking for an update" );
  transmit_( query );

  timers_.start( PERSIST_TIMER, rtt_.rto_ms(), [this] { on_persist_timeout(); } );
}
