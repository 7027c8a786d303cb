#pragma once

#include "connection_error.hh"
#include "segment.hh"
#include "tcp_config.hh"
#include "tcp_receiver.hh"
#include "tcp_sender.hh"
#include "tcp_state.hh"
#include "timer_service.hh"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

/*
 * One endpoint of a connection: a TCPSender and a TCPReceiver driven by the TCPState
 * transition table.
 *
 * Every public method takes the connection's mutex, and the retransmission, persist and
 * TIME_WAIT timers fire under the same mutex, so sends, arrivals and timeouts are
 * serialized. The transmit function runs with the mutex held: it must hand the segment
 * to a channel or a queue and never call back into the connection.
 *
 * Time only moves when tick() is called. TCPSocket ticks with the wall clock; tests tick
 * by hand.
 */
class TCPConnection
{
public:
  using TransmitFunction = std::function<void( const Segment& )>;

  struct Statistics
  {
    uint64_t segments_sent {};     // everything handed to transmit, retransmissions included
    uint64_t segments_received {}; // parsed segments, good or not
    uint64_t bytes_sent {};
    uint64_t bytes_delivered {}; // bytes read() handed to the application
    uint64_t timeout_retransmissions {};
    uint64_t persist_segments {}; // window queries sent while the peer's window was zero

    /* drops, by reason */
    uint64_t malformed {};
    uint64_t corrupt {};
    uint64_t duplicate {};
    uint64_t out_of_window {};
    uint64_t illegal_state {};

    uint64_t estimated_rtt_ms {};
    uint64_t rto_ms {}; // current retransmission timeout, backoff included
  };

  TCPConnection( const TCPConfig& config, TransmitFunction transmit );
  ~TCPConnection();

  TCPConnection( const TCPConnection& other ) = delete;
  TCPConnection& operator=( const TCPConnection& other ) = delete;

  // Passive and active open. Only legal from CLOSED.
  void listen();
  void connect();

  // Queue as much of `data` as the send buffer takes, returning the count accepted.
  // Throws ConnectionError if the connection failed or can no longer send.
  uint64_t write( std::string_view data );

  // No more data will be written. The FIN follows the queued data.
  void close();

  // Give up on the connection: send RST, go to CLOSED.
  void abort();

  // Process a datagram from the peer.
  void receive_datagram( std::string_view bytes );
  void receive( const Segment& segment );

  // Take up to `max_len` bytes the peer has delivered in order.
  std::string read( uint64_t max_len );

  // Advance the connection's clock. Must be called without the mutex held.
  void tick( uint64_t ms_since_last_tick ) { timers_.tick( ms_since_last_tick ); }

  // Blocking variants, for callers on their own thread while something else ticks.
  bool wait_until_established( std::chrono::milliseconds timeout );
  void write_all( std::string_view data, std::chrono::milliseconds timeout );
  std::string read_some( uint64_t max_len, std::chrono::milliseconds timeout );
  bool wait_until_flushed( std::chrono::milliseconds timeout );
  bool wait_until_closed( std::chrono::milliseconds timeout );

  TCPState state() const;
  bool has_error() const;
  std::optional<ConnectionError::Cause> error_cause() const;
  bool eof() const;
  uint64_t bytes_in_flight() const;
  uint16_t peer_window() const;
  uint64_t consecutive_retransmissions() const;
  Statistics statistics() const;
  const TCPConfig& config() const { return config_; }

private:
  static constexpr TimerService::Key TIME_WAIT_TIMER = 3;

  void output( const Segment& segment );
  void send_ack();
  void fail( ConnectionError::Cause cause, bool send_rst );
  void check_error() const;

  bool acceptable_reset( const Segment& segment ) const;
  std::optional<TCPEvent> pending_event() const;
  void apply( TCPEvent event );
  void advance();
  void enter( TCPState state );

  bool can_push() const { return state_ != TCPState::CLOSED and state_ != TCPState::LISTEN; }
  bool established() const;

  TCPConfig config_;
  TransmitFunction transmit_; // raw segments out; the owner serializes them

  mutable std::mutex mutex_ {};
  // guards everything below, and is taken by timers_ before any callback fires

  std::condition_variable changed_ {};
  // notified on every state change, delivery and acknowledgment; the blocking calls wait on it

  TimerService timers_ { mutex_ }; // retransmission and persist (sender), TIME_WAIT (ours)

  TCPSender sender_;
  TCPReceiver receiver_;

  TCPState state_ { TCPState::CLOSED };

  bool close_requested_ {};
  // close() was called but the CLOSE event has not been applied yet

  bool peer_fin_consumed_ {};
  // the peer's FIN has already driven its transition

  bool ack_owed_ {}; // send a bare ack at the end of receive() unless something else went out

  uint16_t last_window_sent_ {};
  // window in our most recent segment; 0 means the peer may be stalled on us

  std::optional<ConnectionError::Cause> error_ {}; // set once, by fail()
  Statistics stats_ {};
};
