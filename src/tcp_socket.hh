#pragma once

#include "address.hh"
#include "datagram_channel.hh"
#include "tcp_config.hh"
#include "tcp_connection.hh"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

/*
 * A connection endpoint with its own threads: one feeds datagrams from the channel into
 * the TCPConnection, one ticks the connection's timers with the wall clock. The calling
 * thread uses the blocking methods below.
 *
 * One socket carries one connection. A listening socket adopts the sender of the first
 * SYN it sees as its peer and ignores every other address from then on.
 */
class TCPSocket
{
public:
  explicit TCPSocket( std::shared_ptr<DatagramChannel> channel, const TCPConfig& config = {} );
  ~TCPSocket();

  TCPSocket( const TCPSocket& other ) = delete;
  TCPSocket& operator=( const TCPSocket& other ) = delete;

  // Active open. Throws ConnectionError if the handshake does not complete in time.
  void connect( const Address& peer, std::chrono::milliseconds timeout );

  // Passive open: wait for a peer to connect.
  void accept( std::chrono::milliseconds timeout );

  // Block until all of `data` is in the send buffer.
  void write( std::string_view data, std::chrono::milliseconds timeout );

  // Block until some bytes arrive; empty at end of stream or on timeout.
  std::string read( uint64_t max_len, std::chrono::milliseconds timeout );

  // Send FIN after the queued data. Returns immediately.
  void close();

  // Send RST and drop the connection.
  void abort() { connection_.abort(); }

  bool wait_until_flushed( std::chrono::milliseconds timeout ) { return connection_.wait_until_flushed( timeout ); }
  bool wait_until_closed( std::chrono::milliseconds timeout ) { return connection_.wait_until_closed( timeout ); }

  bool eof() const { return connection_.eof(); }
  TCPState state() const { return connection_.state(); }
  std::optional<Address> peer() const;
  const Address& local_address() const { return channel_->local_address(); }
  TCPConnection::Statistics statistics() const { return connection_.statistics(); }

private:
  static constexpr std::chrono::milliseconds RECEIVE_POLL { 20 };
  static constexpr std::chrono::milliseconds TICK_INTERVAL { 5 };

  void send_to_peer( const Segment& segment );
  void receive_loop();
  void timer_loop();

  std::shared_ptr<DatagramChannel> channel_;

  mutable std::mutex peer_mutex_ {};
  std::optional<Address> peer_ {};
  bool listening_ {};

  TCPConnection connection_;

  std::atomic<bool> stopping_ { false };
  std::thread receiver_thread_ {};
  std::thread timer_thread_ {};
};
