#pragma once

#include "byte_stream.hh"
#include "outstanding_queue.hh"
#include "rtt_estimator.hh"
#include "segment.hh"
#include "tcp_config.hh"
#include "timer_service.hh"

#include <cstdint>
#include <functional>

/*
 * Sending half of a connection. Reads the outbound byte stream, cuts it into segments of
 * at most `mss` payload bytes and keeps every unacknowledged segment (SYN and FIN included)
 * until the peer's cumulative acknowledgment covers it.
 *
 * The sender fills in seqno, SYN, FIN and payload only; the connection stamps the
 * acknowledgment fields and the checksum on the way out. All methods must be called with
 * the connection's guard held, which is also the guard of the shared TimerService.
 */
class TCPSender
{
public:
  using TransmitFunction = std::function<void( const Segment& )>;
  using GiveUpFunction = std::function<void()>;

  static constexpr TimerService::Key RETRANSMISSION_TIMER = 1;
  static constexpr TimerService::Key PERSIST_TIMER = 2;

  struct Statistics
  {
    uint64_t segments_sent {};           // first transmissions
    uint64_t bytes_sent {};              // payload bytes in first transmissions
    uint64_t timeout_retransmissions {}; // segments resent because the timer expired
    uint64_t timeouts {};
    uint64_t persist_segments {};
    uint64_t ignored_acks {}; // acknowledged something never sent
  };

  /* Construct TCP sender with its outbound stream, initial sequence number and timing parameters */
  TCPSender( ByteStream&& input,
             Wrap32 isn,
             const TCPConfig& config,
             TimerService& timers,
             TransmitFunction transmit,
             GiveUpFunction give_up );

  /* Send as much as the window allows: the SYN first, then data once the SYN is acknowledged */
  void push();

  /* Process the acknowledgment fields of an incoming segment. Returns false for an
     acknowledgment of sequence numbers never sent. */
  bool receive( const Segment& segment );

  /* A segment occupying no sequence numbers, positioned at the next seqno */
  Segment make_empty_segment() const;

  bool syn_sent() const { return syn_sent_; }
  bool syn_acked() const { return syn_sent_ and acked_ > 0; }
  bool fin_sent() const { return fin_sent_; }
  bool fin_acked() const { return fin_sent_ and acked_ == next_seqno_; }

  uint64_t sequence_numbers_in_flight() const { return next_seqno_ - acked_; }
  uint64_t consecutive_retransmissions() const { return consecutive_retransmissions_; }
  uint16_t peer_window() const { return peer_window_; }
  Wrap32 isn() const { return isn_; }
  const RTTEstimator& rtt() const { return rtt_; }
  const Statistics& statistics() const { return stats_; }

  const Writer& writer() const { return input_.writer(); }
  const Reader& reader() const { return input_.reader(); }
  Writer& writer() { return input_.writer(); }

  void set_error() { input_.set_error(); }

private:
  Reader& reader() { return input_.reader(); }

  uint64_t window_room() const;
  bool has_pending_data() const;
  bool count_retry();
  void send_segment( Segment segment );
  void on_retransmission_timeout();
  void on_persist_timeout();

  ByteStream input_;
  Wrap32 isn_;

  /* limits copied from TCPConfig */
  size_t mss_;             // payload bytes per segment
  size_t send_window_cap_; // our own ceiling on sequence numbers in flight
  uint64_t max_retransmissions_;
  // a retry beyond this many calls give_up_()

  TimerService& timers_; // shared with the connection, which owns it
  TransmitFunction transmit_;
  GiveUpFunction give_up_;
  RTTEstimator rtt_;
  // smoothed RTT and the current RTO
  // sampled only from segments sent exactly once
  // doubled on every counted retry, reset by the next sample

  /* state flags */
  bool syn_sent_ {}; // has the SYN gone out?
  bool fin_sent_ {}; // has the FIN gone out? nothing may follow it

  uint16_t peer_window_ { 1 };
  // the receiver's advertised window, in sequence numbers
  // 1 until the SYN-ACK arrives, so only the SYN may be outstanding
  // 0 stops new data and arms the persist timer

  uint64_t next_seqno_ {};
  // absolute seqno of the next new sequence number
  // the SYN takes 0, so the first data byte is 1
  // grows by sequence_length() of every first transmission

  uint64_t acked_ {};
  // everything before this absolute seqno is acknowledged
  // invariant: acked_ <= next_seqno_

  uint64_t consecutive_retransmissions_ {};
  // timeouts and persist expiries since the peer last showed it is alive
  // cleared by an ack of new data, or by any ack while the window is closed

  OutstandingQueue outstanding_ {}; // sent, unacknowledged segments in seqno order
  Statistics stats_ {};
};
