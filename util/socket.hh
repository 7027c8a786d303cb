#pragma once

#include "address.hh"
#include "file_descriptor.hh"

#include <optional>
#include <string>
#include <string_view>

// A received datagram and who sent it
struct Datagram
{
  Address peer;
  std::string payload;
};

// IPv4 UDP socket
class UDPSocket
{
  FileDescriptor fd_;

public:
  UDPSocket();

  void bind( const Address& address );
  Address local_address() const;

  void sendto( const Address& destination, std::string_view payload );

  // wait up to `timeout_ms` for one datagram
  std::optional<Datagram> recv( int timeout_ms );

  void close() { fd_.close(); }
  int fd_num() const { return fd_.fd_num(); }

  static constexpr size_t MAX_DATAGRAM_SIZE = 65536;
};
