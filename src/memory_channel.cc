#include "memory_channel.hh"

using namespace std;

pair<shared_ptr<MemoryChannel>, shared_ptr<MemoryChannel>> MemoryChannel::make_pair( const Address& a,
                                                                                     const Address& b )
{
  auto first = make_shared<MemoryChannel>( a );
  auto second = make_shared<MemoryChannel>( b );
  first->peer_ = second;
  second->peer_ = first;
  return { first, second };
}

void MemoryChannel::send_datagram( [[maybe_unused]] const Address& destination, string payload )
{
  if ( auto peer = peer_.lock() ) {
    peer->deliver( { local_address_, move( payload ) } );
  }
}

void MemoryChannel::deliver( Datagram datagram )
{
  {
    const lock_guard lock( mutex_ );
    inbox_.push_back( move( datagram ) );
  }
  arrived_.notify_one();
}

optional<Datagram> MemoryChannel::receive_datagram( const chrono::milliseconds timeout )
{
  unique_lock lock( mutex_ );
  if ( not arrived_.wait_for( lock, timeout, [this] { return not inbox_.empty(); } ) ) {
    return nullopt;
  }
  Datagram datagram = move( inbox_.front() );
  inbox_.pop_front();
  return datagram;
}

size_t MemoryChannel::pending() const
{
  const lock_guard lock( mutex_ );
  return inbox_.size();
}
