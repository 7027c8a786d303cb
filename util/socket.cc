#include "socket.hh"
#include "exception.hh"

#include <array>
#include <sys/socket.h>

using namespace std;

UDPSocket::UDPSocket() : fd_( CheckSystemCall( "socket", ::socket( AF_INET, SOCK_DGRAM, 0 ) ) ) {}

void UDPSocket::bind( const Address& address )
{
  CheckSystemCall( "bind " + address.to_string(), ::bind( fd_.fd_num(), address.raw(), address.size() ) );
}

Address UDPSocket::local_address() const
{
  Address::Raw address;
  socklen_t size = sizeof( address );
  CheckSystemCall( "getsockname", ::getsockname( fd_.fd_num(), address, &size ) );
  return { address, size };
}

void UDPSocket::sendto( const Address& destination, const string_view payload )
{
  const ssize_t bytes_sent
    = ::sendto( fd_.fd_num(), payload.data(), payload.size(), 0, destination.raw(), destination.size() );
  CheckSystemCall( "sendto", static_cast<int>( bytes_sent ) );
  if ( static_cast<size_t>( bytes_sent ) != payload.size() ) {
    throw runtime_error( "datagram payload too big for sendto()" );
  }
}

optional<Datagram> UDPSocket::recv( const int timeout_ms )
{
  if ( not fd_.wait_readable( timeout_ms ) ) {
    return nullopt;
  }

  Address::Raw source;
  socklen_t source_size = sizeof( source );
  string buffer( MAX_DATAGRAM_SIZE, '\0' );

  const ssize_t len = ::recvfrom( fd_.fd_num(), buffer.data(), buffer.size(), MSG_TRUNC, source, &source_size );
  CheckSystemCall( "recvfrom", static_cast<int>( len ) );
  if ( static_cast<size_t>( len ) > buffer.size() ) {
    throw runtime_error( "recvfrom (oversized datagram)" );
  }
  buffer.resize( len );

  return Datagram { { source, source_size }, move( buffer ) };
}
