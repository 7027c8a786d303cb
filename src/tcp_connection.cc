#include "tcp_connection.hh"
#include "debug.hh"
#include "random.hh"

#include <algorithm>
#include <stdexcept>

using namespace std;

namespace {
// a fixed ISN makes traces reproducible; otherwise a random one
Wrap32 choose_isn( const TCPConfig& config )
{
  if ( config.fixed_isn.has_value() ) {
    return *config.fixed_isn;
  }
  auto rng = get_random_engine();
  return Wrap32 { static_cast<uint32_t>( rng() ) };
}

const TCPConfig& validated( const TCPConfig& config )
{
  config.validate();
  return config;
}
} // namespace

TCPConnection::TCPConnection( const TCPConfig& config, TransmitFunction transmit )
  : config_( validated( config ) )
  , transmit_( move( transmit ) )
  , sender_( ByteStream( config_.send_capacity ),
             choose_isn( config_ ),
             config_,
             timers_,
             [this]( const Segment& segment ) { output( segment ); },
             [this] { fail( ConnectionError::Cause::RETRANSMISSION_LIMIT, true ); } )
  , receiver_( Reassembler( ByteStream( config_.recv_capacity ) ) )
{
  if ( not transmit_ ) {
    throw invalid_argument( "TCPConnection: missing transmit function" );
  }
}

TCPConnection::~TCPConnection()
{
  const lock_guard lock( mutex_ );
  timers_.cancel_all();
}

void TCPConnection::check_error() const
{
  if ( error_.has_value() ) {
    throw ConnectionError( *error_, "connection failed: " + to_string( *error_ ) );
  }
}

bool TCPConnection::established() const
{
  switch ( state_ ) {
    case TCPState::CLOSED:
    case TCPState::LISTEN:
    case TCPState::SYN_SENT:
    case TCPState::SYN_RCVD:
      return false;
    default:
      return true;
  }
}

// Every segment leaves through here: the sender fills seqno, flags and payload, and the
// receiver's ackno and window are stamped on before the checksum.
void TCPConnection::output( const Segment& segment )
{
  Segment out = segment;
  if ( const auto ackno = receiver_.ackno() ) {
    out.flags |= Segment::FLAG_ACK;
    out.ackno = *ackno;
  }
  out.window = receiver_.window_size();
  out.seal();

  last_window_sent_ = out.window; // read() compares against this to spot a reopened window
  stats_.segments_sent++;
  debug( "tcp: send ", out.to_string() );
  transmit_( out );
}

void TCPConnection::send_ack()
{
  output( sender_.make_empty_segment() );
}

void TCPConnection::enter( const TCPState state )
{
  debug( "tcp: ", to_string( state_ ), " -> ", to_string( state ) );
  state_ = state;

  // TIME_WAIT ends on its own timer; CLOSED leaves nothing to retransmit
  if ( state_ == TCPState::TIME_WAIT ) {
    timers_.start( TIME_WAIT_TIMER, config_.time_wait_ms, [this] {
      apply( TCPEvent::TIMEOUT );
      changed_.notify_all();
    } );
  } else if ( state_ == TCPState::CLOSED ) {
    timers_.cancel_all();
  }
  changed_.notify_all();
}

void TCPConnection::apply( const TCPEvent event )
{
  const auto transition = find_transition( state_, event );
  if ( not transition.has_value() ) {
    debug( "tcp: ignoring ", to_string( event ), " in ", to_string( state_ ) );
    return;
  }

  // mark the trigger used so pending_event() does not report it again
  if ( event == TCPEvent::RECV_FIN ) {
    peer_fin_consumed_ = true;
  } else if ( event == TCPEvent::CLOSE ) {
    close_requested_ = false;
  }
  enter( transition->to );

  switch ( transition->action ) {
    case TCPAction::NONE:
      break;
    case TCPAction::SEND_SYN:
    case TCPAction::SEND_SYN_ACK:
    case TCPAction::SEND_FIN:
      sender_.push();
      break;
    case TCPAction::SEND_ACK:
      ack_owed_ = true; // folded into whatever receive() sends next
      break;
  }
}

// The event the current state is waiting for, if it has already happened.
optional<TCPEvent> TCPConnection::pending_event() const
{
  const bool fin_pending = receiver_.fin_received() and not peer_fin_consumed_;

  switch ( state_ ) {
    case TCPState::SYN_RCVD:
      if ( sender_.syn_acked() ) {
        return TCPEvent::RECV_ACK;
      }
      break;
    case TCPState::ESTABLISHED:
      if ( fin_pending ) {
        return TCPEvent::RECV_FIN;
      }
      if ( close_requested_ ) {
        return TCPEvent::CLOSE;
      }
      break;
    case TCPState::CLOSE_WAIT:
      if ( close_requested_ ) {
        return TCPEvent::CLOSE;
      }
      break;
    case TCPState::FIN_WAIT_1:
      if ( sender_.fin_acked() ) {
        return TCPEvent::RECV_ACK;
      }
      if ( fin_pending ) {
        return TCPEvent::RECV_FIN;
      }
      break;
    case TCPState::FIN_WAIT_2:
      if ( fin_pending ) {
        return TCPEvent::RECV_FIN;
      }
      break;
    case TCPState::CLOSING:
    case TCPState::LAST_ACK:
      if ( sender_.fin_acked() ) {
        return TCPEvent::RECV_ACK;
      }
      break;
    default:
      break;
  }
  return nullopt;
}

// Apply events until the state stops moving (an ack and a FIN in one segment take two steps).
void TCPConnection::advance()
{
  while ( const auto event = pending_event() ) {
    apply( *event );
  }
}

void TCPConnection::fail( const ConnectionError::Cause cause, const bool send_rst )
{
  if ( send_rst and state_ != TCPState::CLOSED and state_ != TCPState::LISTEN ) {
    Segment rst = sender_.make_empty_segment();
    rst.flags |= Segment::FLAG_RST;
    output( rst );
  }

  warn( "tcp: connection aborted (", to_string( cause ), ") in ", to_string( state_ ) );
  error_ = cause;
  // both streams fail, so blocked readers and writers see the error
  sender_.set_error();
  receiver_.set_error();
  enter( TCPState::CLOSED );
}

void TCPConnection::listen()
{
  const lock_guard lock( mutex_ );
  if ( state_ != TCPState::CLOSED or sender_.syn_sent() or error_.has_value() ) {
    throw logic_error( "TCPConnection::listen() in state " + to_string( state_ ) );
  }
  apply( TCPEvent::LISTEN );
}

void TCPConnection::connect()
{
  const lock_guard lock( mutex_ );
  if ( state_ != TCPState::CLOSED or sender_.syn_sent() or error_.has_value() ) {
    throw logic_error( "TCPConnection::connect() in state " + to_string( state_ ) );
  }
  apply( TCPEvent::CONNECT );
}

uint64_t TCPConnection::write( const string_view data )
{
  const lock_guard lock( mutex_ );
  check_error();
  if ( not can_push() or sender_.writer().is_closed() ) {
    throw ConnectionError( ConnectionError::Cause::NOT_CONNECTED, "write on a connection that cannot send" );
  }

  // take what fits in the send buffer; the rest is the caller's to retry
  const uint64_t accepted = min<uint64_t>( data.size(), sender_.writer().available_capacity() );
  sender_.writer().push( string( data.substr( 0, accepted ) ) );
  sender_.push();
  return accepted;
}

void TCPConnection::close()
{
  const lock_guard lock( mutex_ );
  if ( state_ == TCPState::LISTEN or state_ == TCPState::SYN_SENT ) {
    apply( TCPEvent::CLOSE );
    return;
  }
  if ( state_ == TCPState::CLOSED or sender_.writer().is_closed() ) {
    return;
  }

  // the FIN goes out after the buffered data, once the window has room for it
  sender_.writer().close();
  close_requested_ = true;
  advance();
  sender_.push();
}

void TCPConnection::abort()
{
  const lock_guard lock( mutex_ );
  if ( state_ == TCPState::CLOSED ) {
    return;
  }
  if ( state_ != TCPState::LISTEN ) {
    Segment rst = sender_.make_empty_segment();
    rst.flags |= Segment::FLAG_RST;
    output( rst );
  }
  sender_.set_error();
  receiver_.set_error();
  enter( TCPState::CLOSED );
}

void TCPConnection::receive_datagram( const string_view bytes )
{
  Segment segment;
  if ( not parse( segment, bytes ) ) {
    const lock_guard lock( mutex_ );
    stats_.malformed++;
    debug( "tcp: dropped ", to_string( DropReason::MALFORMED ), " datagram of ", bytes.size(), " bytes" );
    return;
  }
  receive( segment );
}

// An RST is believed only if it fits the sequence space we expect from the peer.
bool TCPConnection::acceptable_reset( const Segment& segment ) const
{
  if ( state_ == TCPState::LISTEN ) {
    return false;
  }
  if ( state_ == TCPState::SYN_SENT ) {
    return segment.has( Segment::FLAG_ACK ) and segment.ackno == sender_.isn() + 1;
  }

  const auto ackno = receiver_.ackno();
  if ( not ackno.has_value() ) {
    return false;
  }
  // distance in wrapped sequence space; a closed window still accepts exactly the ackno
  const uint32_t offset = segment.seqno.raw_value() - ackno->raw_value();
  return offset < max<uint32_t>( receiver_.window_size(), 1 );
}

void TCPConnection::receive( const Segment& segment )
{
  const lock_guard lock( mutex_ );
  stats_.segments_received++;

  if ( segment.is_corrupt() ) {
    stats_.corrupt++;
    debug( "tcp: dropped ", to_string( DropReason::CORRUPT ), " segment" );
    return;
  }

  if ( state_ == TCPState::CLOSED ) {
    stats_.illegal_state++;
    return;
  }

  if ( segment.has( Segment::FLAG_RST ) ) {
    if ( acceptable_reset( segment ) ) {
      fail( ConnectionError::Cause::PEER_RESET, false );
    } else {
      stats_.illegal_state++;
    }
    return;
  }

  const uint64_t sent_before = stats_.segments_sent; // did this segment already provoke a reply?
  const auto note_drop = [this]( const optional<DropReason> reason ) {
    if ( not reason.has_value() ) {
      return;
    }
    switch ( *reason ) {
      case DropReason::MALFORMED:
        stats_.malformed++;
        break;
      case DropReason::CORRUPT:
        stats_.corrupt++;
        break;
      case DropReason::DUPLICATE:
        stats_.duplicate++;
        break;
      case DropReason::OUT_OF_WINDOW:
        stats_.out_of_window++;
        break;
      case DropReason::ILLEGAL_STATE:
        stats_.illegal_state++;
        break;
    }
    debug( "tcp: dropped ", to_string( *reason ), " segment in ", to_string( state_ ) );
  };

  // handshake states take only the one segment they wait for
  if ( state_ == TCPState::LISTEN ) {
    if ( segment.kind() != Segment::Kind::SYN ) {
      note_drop( DropReason::ILLEGAL_STATE );
      return;
    }
    note_drop( receiver_.receive( segment ).dropped );
    apply( TCPEvent::RECV_SYN );
  } else if ( state_ == TCPState::SYN_SENT ) {
    if ( segment.kind() != Segment::Kind::SYN_ACK or not sender_.receive( segment ) or not sender_.syn_acked() ) {
      note_drop( DropReason::ILLEGAL_STATE );
      return;
    }
    note_drop( receiver_.receive( segment ).dropped );
    apply( TCPEvent::RECV_SYN_ACK );
  } else {
    if ( not sender_.receive( segment ) ) {
      ack_owed_ = true; // tell the peer where we really are
    }
    const auto outcome = receiver_.receive( segment );
    note_drop( outcome.dropped );
    ack_owed_ = ack_owed_ or outcome.needs_ack;

    // a retransmitted FIN means our acknowledgment was lost; linger from now
    if ( state_ == TCPState::TIME_WAIT and segment.has( Segment::FLAG_FIN ) ) {
      timers_.restart( TIME_WAIT_TIMER, config_.time_wait_ms );
    }
  }

  advance();
  if ( can_push() ) {
    sender_.push(); // an ack may have opened the window
  }
  // data or a FIN sent just now already carries the acknowledgment
  if ( ack_owed_ and stats_.segments_sent == sent_before and state_ != TCPState::CLOSED ) {
    send_ack();
  }
  ack_owed_ = false;
  changed_.notify_all();
}

string TCPConnection::read( const uint64_t max_len )
{
  const lock_guard lock( mutex_ );
  string out;
  ::read( receiver_.reader(), max_len, out );
  if ( out.empty() ) {
    check_error();
    return out;
  }
  stats_.bytes_delivered += out.size();

  // the peer may be waiting on a zero window; tell it as soon as space opens
  if ( last_window_sent_ == 0 and receiver_.window_size() > 0 and receiver_.syn_received()
       and state_ != TCPState::CLOSED ) {
    send_ack();
  }
  return out;
}

bool TCPConnection::wait_until_established( const chrono::milliseconds timeout )
{
  unique_lock lock( mutex_ );
  changed_.wait_for( lock, timeout, [this] { return error_.has_value() or established() or state_ == TCPState::CLOSED; } );
  check_error();
  return established();
}

// write() in a loop, sleeping on changed_ while the send buffer is full
void TCPConnection::write_all( string_view data, const chrono::milliseconds timeout )
{
  const auto deadline = chrono::steady_clock::now() + timeout;
  while ( true ) {
    data.remove_prefix( write( data ) );
    if ( data.empty() ) {
      return;
    }

    unique_lock lock( mutex_ );
    const bool ready = changed_.wait_until( lock, deadline, [this] {
      return error_.has_value() or state_ == TCPState::CLOSED or sender_.writer().available_capacity() > 0;
    } );
    if ( not ready ) {
      throw ConnectionError( ConnectionError::Cause::TIMED_OUT, "write: send buffer stayed full" );
    }
  }
}

string TCPConnection::read_some( const uint64_t max_len, const chrono::milliseconds timeout )
{
  {
    unique_lock lock( mutex_ );
    changed_.wait_for( lock, timeout, [this] {
      return error_.has_value() or state_ == TCPState::CLOSED or receiver_.reader().bytes_buffered() > 0
             or receiver_.reader().is_finished();
    } );
  }
  return read( max_len );
}

// Everything written has been sent and acknowledged
bool TCPConnection::wait_until_flushed( const chrono::milliseconds timeout )
{
  unique_lock lock( mutex_ );
  const TCPSender& sender = sender_; // the const view exposes reader()
  const auto flushed = [&sender] {
    return sender.syn_acked() and sender.reader().bytes_buffered() == 0 and sender.sequence_numbers_in_flight() == 0;
  };
  changed_.wait_for( lock, timeout, [&] { return error_.has_value() or flushed(); } );
  return not error_.has_value() and flushed();
}

bool TCPConnection::wait_until_closed( const chrono::milliseconds timeout )
{
  unique_lock lock( mutex_ );
  return changed_.wait_for( lock, timeout, [this] { return state_ == TCPState::CLOSED; } );
}

TCPState TCPConnection::state() const
{
  const lock_guard lock( mutex_ );
  return state_;
}

bool TCPConnection::has_error() const
{
  const lock_guard lock( mutex_ );
  return error_.has_value();
}

optional<ConnectionError::Cause> TCPConnection::error_cause() const
{
  const lock_guard lock( mutex_ );
  return error_;
}

bool TCPConnection::eof() const
{
  const lock_guard lock( mutex_ );
  return receiver_.reader().is_finished();
}

uint64_t TCPConnection::bytes_in_flight() const
{
  const lock_guard lock( mutex_ );
  return sender_.sequence_numbers_in_flight();
}

uint16_t TCPConnection::peer_window() const
{
  const lock_guard lock( mutex_ );
  return sender_.peer_window();
}

uint64_t TCPConnection::consecutive_retransmissions() const
{
  const lock_guard lock( mutex_ );
  return sender_.consecutive_retransmissions();
}

TCPConnection::Statistics TCPConnection::statistics() const
{
  const lock_guard lock( mutex_ );
  Statistics stats = stats_;
  // the sender keeps its own counters; merge them into the snapshot
  stats.bytes_sent = sender_.statistics().bytes_sent;
  stats.timeout_retransmissions = sender_.statistics().timeout_retransmissions;
  stats.persist_segments = sender_.statistics().persist_segments;
  stats.estimated_rtt_ms = static_cast<uint64_t>( sender_.rtt().estimated_rtt_ms() );
  stats.rto_ms = sender_.rtt().rto_ms();
  return stats;
}
