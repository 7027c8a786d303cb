#pragma once

#include "address.hh"
#include "socket.hh"

#include <chrono>
#include <optional>
#include <string>

// The unreliable transport underneath both engines: fire-and-forget sends, blocking
// receives. Implementations may drop, corrupt, delay, reorder or duplicate anything.
class DatagramChannel
{
public:
  virtual void send_datagram( const Address& destination, std::string payload ) = 0;

  // Wait up to `timeout` for the next datagram addressed to this endpoint.
  virtual std::optional<Datagram> receive_datagram( std::chrono::milliseconds timeout ) = 0;

  virtual const Address& local_address() const = 0;

  virtual ~DatagramChannel() = default;
};
