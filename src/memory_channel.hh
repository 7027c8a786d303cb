#pragma once

#include "datagram_channel.hh"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

// In-process datagram channel. make_pair() returns two endpoints wired to each other;
// whatever one sends (to any destination) lands in the other's inbox.
class MemoryChannel : public DatagramChannel
{
public:
  static std::pair<std::shared_ptr<MemoryChannel>, std::shared_ptr<MemoryChannel>> make_pair( const Address& a,
                                                                                              const Address& b );

  explicit MemoryChannel( const Address& local_address ) : local_address_( local_address ) {}

  void send_datagram( const Address& destination, std::string payload ) override;
  std::optional<Datagram> receive_datagram( std::chrono::milliseconds timeout ) override;
  const Address& local_address() const override { return local_address_; }

  // number of datagrams waiting in this endpoint's inbox
  size_t pending() const;

private:
  void deliver( Datagram datagram );

  Address local_address_;
  std::weak_ptr<MemoryChannel> peer_ {};

  mutable std::mutex mutex_ {};
  std::condition_variable arrived_ {};
  std::deque<Datagram> inbox_ {};
};
