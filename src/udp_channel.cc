#include "udp_channel.hh"

using namespace std;

namespace {
Address bind_socket( UDPSocket& socket, const Address& bind_address )
{
  socket.bind( bind_address );
  return socket.local_address();
}
} // namespace

UDPChannel::UDPChannel( const Address& bind_address ) : local_address_( bind_socket( socket_, bind_address ) ) {}

void UDPChannel::send_datagram( const Address& destination, string payload )
{
  socket_.sendto( destination, payload );
}

optional<Datagram> UDPChannel::receive_datagram( const chrono::milliseconds timeout )
{
  return socket_.recv( static_cast<int>( timeout.count() ) );
}
