#pragma once

#include "segment.hh"
#include "window_config.hh"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/*
 * Receiving half of the windowed retransmission engine.
 *
 * Cumulative policy: only the next expected unit is accepted; anything else is thrown
 * away and the last cumulative acknowledgment is repeated.
 * Selective policy: any unit in [expected, expected + N) is acknowledged individually,
 * buffered if early, and released to the application as soon as the gap before it closes.
 *
 * Units handed to the application are available through pop()/take_delivered().
 */
class WindowReceiver
{
public:
  using TransmitFunction = std::function<void( const Segment& )>;

  struct Statistics
  {
    uint64_t units_received {};  // every parsed segment, including corrupt ones
    uint64_t units_delivered {}; // handed to the application in order; never decreases
    uint64_t units_buffered {};  // arrived early and waited in the reorder buffer
    uint64_t duplicates {};
    uint64_t out_of_window {}; // ahead of what the window accepts
    uint64_t corrupt {};
    uint64_t malformed {};
    uint64_t acks_sent {};
  };

  WindowReceiver( const WindowConfig& config, TransmitFunction transmit );

  WindowReceiver( const WindowReceiver& other ) = delete;
  WindowReceiver& operator=( const WindowReceiver& other ) = delete;

  void receive_datagram( std::string_view bytes );
  void receive( const Segment& segment );

  // Next unit for the application, if one has been delivered
  std::optional<std::string> pop();
  std::vector<std::string> take_delivered();

  // Wait until at least `count` units have been delivered in total. False on timeout.
  bool wait_for_delivered( uint64_t count, std::chrono::milliseconds timeout );

  uint64_t expected() const;
  size_t buffered() const;
  Statistics statistics() const;

private:
  void receive_cumulative( uint64_t seqno, std::string payload );
  void receive_selective( uint64_t seqno, std::string payload );
  void deliver( std::string payload );
  void send_ack( uint64_t seqno );
  void drop( DropReason reason, const Segment& segment );

  WindowConfig config_;
  TransmitFunction transmit_;

  mutable std::mutex mutex_ {};
  std::condition_variable delivered_cv_ {}; // wait_for_delivered() sleeps here

  uint64_t expected_ {};                              // receiver base
  std::map<uint64_t, std::string> reorder_buffer_ {}; // keys in (expected, expected + N)
  std::deque<std::string> delivered_ {}; // in order, waiting for pop() or take_delivered()
  Statistics stats_ {};
};
