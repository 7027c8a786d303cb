#pragma once

#include "address.hh"
#include "datagram_channel.hh"
#include "window_config.hh"
#include "window_receiver.hh"
#include "window_sender.hh"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/*
 * WindowSender and WindowReceiver run over a DatagramChannel with their own threads,
 * the way TCPSocket runs a TCPConnection: one thread feeds arriving datagrams in, the
 * sender also gets one that ticks its timers with the wall clock.
 *
 * Both start working on construction. stop() (or the destructor) joins the threads;
 * units still in flight at that point are abandoned.
 */
class WindowSenderEndpoint
{
public:
  WindowSenderEndpoint( std::shared_ptr<DatagramChannel> channel, const Address& peer, const WindowConfig& config );
  ~WindowSenderEndpoint();

  WindowSenderEndpoint( const WindowSenderEndpoint& other ) = delete;
  WindowSenderEndpoint& operator=( const WindowSenderEndpoint& other ) = delete;

  // Block until the window has room, then send. Throws ConnectionError on timeout or
  // once a unit exhausted its retransmissions.
  void send( std::string payload, std::chrono::milliseconds timeout ) { sender_.send( std::move( payload ), timeout ); }

  // Block until every unit sent so far is acknowledged. False on timeout or fatal error.
  bool wait_for_completion( std::chrono::milliseconds timeout ) { return sender_.wait_until_drained( timeout ); }

  void stop();

  bool has_error() const { return sender_.has_error(); }
  WindowSender::Statistics statistics() const { return sender_.statistics(); }
  const Address& peer() const { return peer_; }

private:
  static constexpr std::chrono::milliseconds RECEIVE_POLL { 20 };
  static constexpr std::chrono::milliseconds TICK_INTERVAL { 5 };

  void receive_loop();
  void timer_loop();

  std::shared_ptr<DatagramChannel> channel_;
  Address peer_;
  WindowSender sender_;

  std::atomic<bool> stopping_ { false };
  std::thread receiver_thread_ {};
  std::thread timer_thread_ {};
};

class WindowReceiverEndpoint
{
public:
  WindowReceiverEndpoint( std::shared_ptr<DatagramChannel> channel, const WindowConfig& config );
  ~WindowReceiverEndpoint();

  WindowReceiverEndpoint( const WindowReceiverEndpoint& other ) = delete;
  WindowReceiverEndpoint& operator=( const WindowReceiverEndpoint& other ) = delete;

  // Next unit in order, waiting up to `timeout` for it
  std::optional<std::string> receive( std::chrono::milliseconds timeout );

  // Wait until `count` units have been delivered in total, then take them all
  std::vector<std::string> receive_all( uint64_t count, std::chrono::milliseconds timeout );

  void stop();

  WindowReceiver::Statistics statistics() const { return receiver_.statistics(); }
  std::optional<Address> peer() const;

private:
  static constexpr std::chrono::milliseconds RECEIVE_POLL { 20 };

  void send_ack( const Segment& ack );
  void receive_loop();

  std::shared_ptr<DatagramChannel> channel_;

  mutable std::mutex peer_mutex_ {};
  std::optional<Address> peer_ {}; // where acknowledgments go: the sender of the latest data

  WindowReceiver receiver_;
  uint64_t taken_ {};

  std::atomic<bool> stopping_ { false };
  std::thread receiver_thread_ {};
};
