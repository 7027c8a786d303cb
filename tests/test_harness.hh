#pragma once

#include "segment.hh"
#include "tcp_config.hh"
#include "tcp_connection.hh"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

// Collects whatever a component transmits so a test can inspect, drop, reorder or
// deliver it later. Transmit functions run under the component's mutex, so nothing may
// be delivered from inside them.
class SegmentLog
{
public:
  std::function<void( const Segment& )> port()
  {
    return [this]( const Segment& segment ) { segments_.push_back( segment ); };
  }

  bool empty() const { return segments_.empty(); }
  size_t size() const { return segments_.size(); }
  const Segment& front() const { return segments_.front(); }
  const Segment& back() const { return segments_.back(); }

  Segment pop()
  {
    Segment segment = std::move( segments_.front() );
    segments_.pop_front();
    return segment;
  }

  std::deque<Segment> take()
  {
    std::deque<Segment> out;
    out.swap( segments_ );
    return out;
  }

  void clear() { segments_.clear(); }

private:
  std::deque<Segment> segments_ {};
};

// Two connections wired back to back through SegmentLogs, driven by hand.
struct ConnectionPair
{
  explicit ConnectionPair( TCPConfig client_config = {}, TCPConfig server_config = {} )
  {
    client_config.fixed_isn = Wrap32 { 1000 };
    server_config.fixed_isn = Wrap32 { 0xFFFFFFF0 }; // wraps during a transfer
    client = std::make_unique<TCPConnection>( client_config, to_server.port() );
    server = std::make_unique<TCPConnection>( server_config, to_client.port() );
  }

  // Deliver everything in flight, in both directions, until both sides go quiet.
  // `keep` decides per segment whether the channel lets it through.
  void exchange( const std::function<bool( const Segment& )>& keep = {} )
  {
    while ( not to_server.empty() or not to_client.empty() ) {
      for ( auto& segment : to_server.take() ) {
        if ( not keep or keep( segment ) ) {
          server->receive_datagram( segment.serialize() );
        }
      }
      for ( auto& segment : to_client.take() ) {
        if ( not keep or keep( segment ) ) {
          client->receive_datagram( segment.serialize() );
        }
      }
    }
  }

  void tick( uint64_t ms )
  {
    client->tick( ms );
    server->tick( ms );
  }

  // Advance one side's clock by its current retransmission timeout. This reaches the
  // retransmission or persist deadline as long as no time passed since the timer was armed.
  static void expire_rto( TCPConnection& connection ) { connection.tick( connection.statistics().rto_ms ); }

  void handshake()
  {
    server->listen();
    client->connect();
    exchange();
  }

  SegmentLog to_server {};
  SegmentLog to_client {};
  std::unique_ptr<TCPConnection> client {};
  std::unique_ptr<TCPConnection> server {};
};
