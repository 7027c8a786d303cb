#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/socket.h>

//! An IPv4 endpoint (address and port), as the datagram channels name their peers.
class Address
{
public:
  //! \brief Storage big enough for any socket address, handed to recvfrom/getsockname.
  class Raw
  {
  public:
    sockaddr_storage storage {}; //!< The wrapped struct itself.
    // NOLINTBEGIN (*-explicit-*)
    operator sockaddr*();
    operator const sockaddr*() const;
    // NOLINTEND (*-explicit-*)
  };

  //! Construct from a dotted-quad string ("10.0.0.1") and a port (host byte order).
  //! Throws std::invalid_argument if `ip` is not a numeric IPv4 address.
  explicit Address( const std::string& ip, std::uint16_t port = 0 );

  //! Construct from a socket address filled in by the kernel.
  Address( const sockaddr* addr, std::size_t size );

  bool operator==( const Address& other ) const;
  bool operator!=( const Address& other ) const { return not operator==( other ); }

  std::string ip() const;
  uint16_t port() const;

  //! "10.0.0.1:4000"
  std::string to_string() const;

  //! \name Low-level access for the socket calls
  //!@{
  socklen_t size() const { return size_; }
  const sockaddr* raw() const { return static_cast<const sockaddr*>( address_ ); }
  //!@}

private:
  socklen_t size_; //!< Bytes of `address_` in use
  Raw address_ {};
};
