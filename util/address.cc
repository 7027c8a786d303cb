#include "address.hh"

#include <arpa/inet.h>
#include <array>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>

using namespace std;

Address::Raw::operator sockaddr*()
{
  return reinterpret_cast<sockaddr*>( &storage ); // NOLINT(*-reinterpret-cast)
}

Address::Raw::operator const sockaddr*() const
{
  return reinterpret_cast<const sockaddr*>( &storage ); // NOLINT(*-reinterpret-cast)
}

Address::Address( const string& ip, const uint16_t port ) : size_( sizeof( sockaddr_in ) )
{
  sockaddr_in ipv4 {};
  ipv4.sin_family = AF_INET;
  ipv4.sin_port = htons( port );
  // numeric only: channel endpoints are never looked up by name
  if ( inet_pton( AF_INET, ip.c_str(), &ipv4.sin_addr ) != 1 ) {
    throw invalid_argument( "Address: not a dotted-quad IPv4 address: \"" + ip + "\"" );
  }
  memcpy( &address_.storage, &ipv4, sizeof( ipv4 ) );
}

Address::Address( const sockaddr* addr, const size_t size ) : size_( size )
{
  if ( size > sizeof( address_.storage ) ) {
    throw runtime_error( "Address: sockaddr of " + ::to_string( size ) + " bytes does not fit" );
  }
  memcpy( &address_.storage, addr, size );
}

bool Address::operator==( const Address& other ) const
{
  return size_ == other.size_ and 0 == memcmp( &address_.storage, &other.address_.storage, size_ );
}

string Address::ip() const
{
  if ( address_.storage.ss_family != AF_INET ) {
    throw runtime_error( "Address::ip() called on a non-IPv4 address" );
  }
  sockaddr_in ipv4 {};
  memcpy( &ipv4, &address_.storage, sizeof( ipv4 ) );

  array<char, INET_ADDRSTRLEN> text {};
  if ( inet_ntop( AF_INET, &ipv4.sin_addr, text.data(), text.size() ) == nullptr ) {
    throw runtime_error( "Address::ip(): inet_ntop failed" );
  }
  return text.data();
}

uint16_t Address::port() const
{
  if ( address_.storage.ss_family != AF_INET ) {
    throw runtime_error( "Address::port() called on a non-IPv4 address" );
  }
  sockaddr_in ipv4 {};
  memcpy( &ipv4, &address_.storage, sizeof( ipv4 ) );
  return ntohs( ipv4.sin_port );
}

string Address::to_string() const
{
  if ( address_.storage.ss_family != AF_INET ) {
    return "(non-IPv4 address)";
  }
  return ip() + ":" + ::to_string( port() );
}
