#pragma once

#include "outstanding_queue.hh"
#include "segment.hh"
#include "timer_service.hh"
#include "window_config.hh"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

/*
 * Sending half of the windowed retransmission engine.
 *
 * Units are numbered 0, 1, 2, ... and at most `window_size` of them may be
 * unacknowledged at once (base <= next <= base + N). Under the cumulative policy a
 * single timer covers the oldest unit and a timeout resends the whole window; under
 * the selective policy every unit has its own timer and only the expired unit is
 * resent.
 *
 * Thread-safe: every public method takes the sender's mutex, and timer callbacks run
 * under the same mutex. The transmit function is called with that mutex held, so it
 * must hand the segment off (to a channel or a queue) and never call back into the
 * sender.
 */
class WindowSender
{
public:
  using TransmitFunction = std::function<void( const Segment& )>;

  struct Statistics
  {
    uint64_t units_sent {};               // first transmissions
    uint64_t timeout_retransmissions {};  // resends caused by a timer expiring
    uint64_t feedback_retransmissions {}; // resends caused by duplicate acknowledgments
    uint64_t timeouts {};                 // timer expiries (one per window under the cumulative policy)
    uint64_t acks_received {};
    uint64_t duplicate_acks {}; // acknowledged nothing new
    uint64_t ignored_acks {}; // acknowledged something never sent
    uint64_t corrupt {};   // acknowledgments failing the checksum
    uint64_t malformed {}; // datagrams too short or with impossible flags
  };

  WindowSender( const WindowConfig& config, TransmitFunction transmit );
  ~WindowSender();

  WindowSender( const WindowSender& other ) = delete;
  WindowSender& operator=( const WindowSender& other ) = delete;

  // Send one unit if the window has room; returns false (sending nothing) if it is full.
  // Throws ConnectionError after a fatal error.
  bool try_send( std::string payload );

  // Wait for window space, then send. Throws ConnectionError on timeout or fatal error.
  void send( std::string payload, std::chrono::milliseconds timeout );

  // Process an acknowledgment from the peer, raw or already parsed.
  void receive_datagram( std::string_view bytes );
  void receive( const Segment& ack );

  // Advance the sender's clock and fire any expired retransmission timers.
  void tick( uint64_t ms_since_last_tick ) { timers_.tick( ms_since_last_tick ); }

  // Wait until every sent unit is acknowledged. False on timeout or fatal error.
  bool wait_until_drained( std::chrono::milliseconds timeout );

  uint64_t base() const;
  uint64_t next_seqno() const;
  uint64_t units_in_flight() const;
  bool has_error() const;
  Statistics statistics() const;
  const WindowConfig& config() const { return config_; }

private:
  static constexpr TimerService::Key WINDOW_TIMER = 0; // the cumulative policy's only timer

  enum class Cause
  {
    TIMEOUT,
    FEEDBACK
  };

  bool window_open() const { return next_seqno_ < base_ + config_.window_size; }
  void send_unit( std::string payload );
  void arm_timer( uint64_t seqno );
  void retransmit( OutstandingUnit& unit, Cause cause );
  void retransmit_window( Cause cause );

  void receive_cumulative( uint64_t acked );
  void receive_selective( uint64_t acked );
  void on_timeout( TimerService::Key key );
  void fail( uint64_t seqno );
  void check_error() const;

  WindowConfig config_;
  TransmitFunction transmit_;

  mutable std::mutex mutex_ {};
  std::condition_variable window_changed_ {}; // base moved or error set: wakes send() and wait_until_drained()
  TimerService timers_ { mutex_ };
  // cumulative: WINDOW_TIMER only
  // selective: one timer per outstanding unit, keyed by its seqno

  uint64_t base_ {};
  // oldest unacknowledged unit; equals next_seqno_ when nothing is in flight

  uint64_t next_seqno_ {}; // number the next new unit gets

  uint64_t duplicate_ack_run_ {};
  // cumulative acks in a row that moved nothing; reset when base advances

  bool error_ {}; // a unit ran out of retransmissions; the sender is finished

  OutstandingQueue outstanding_ {};
  // every unit in [base_, next_seqno_); under the selective policy acknowledged ones
  // stay until the units before them are acknowledged too

  Statistics stats_ {};
};
