#pragma once

#include "datagram_channel.hh"
#include "socket.hh"

// DatagramChannel over a real UDP socket
class UDPChannel : public DatagramChannel
{
public:
  explicit UDPChannel( const Address& bind_address );

  void send_datagram( const Address& destination, std::string payload ) override;
  std::optional<Datagram> receive_datagram( std::chrono::milliseconds timeout ) override;
  const Address& local_address() const override { return local_address_; }

private:
  UDPSocket socket_ {};
  Address local_address_;
};
