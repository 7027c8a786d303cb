#pragma once

#include "reassembler.hh"
#include "segment.hh"
#include "wrapping_integers.hh"

#include <cstdint>
#include <optional>

/*
 * Receiving half of a connection. Learns the peer's ISN from its SYN, maps each
 * segment's seqno to a stream index and hands the payload to the Reassembler.
 * Reports what the connection should send back: the acknowledgment fields come from
 * ackno() and window_size() at the time of sending.
 */
class TCPReceiver
{
public:
  struct Outcome
  {
    bool needs_ack {};                  // the peer should hear our current ackno and window
    std::optional<DropReason> dropped {}; // set if the segment contributed nothing
  };

  explicit TCPReceiver( Reassembler&& reassembler ) : reassembler_( std::move( reassembler ) ) {}

  // Process an intact segment from the peer.
  Outcome receive( const Segment& segment );

  // The next seqno we need, once the SYN has arrived.
  std::optional<Wrap32> ackno() const;

  // Free receive-buffer capacity, as it fits in the 16-bit window field.
  uint16_t window_size() const;

  bool syn_received() const { return isn_.has_value(); }
  bool fin_received() const { return reassembler_.writer().is_closed(); }
  uint64_t bytes_pending() const { return reassembler_.count_bytes_pending(); }

  Reader& reader() { return reassembler_.reader(); }
  const Reader& reader() const { return reassembler_.reader(); }
  const Writer& writer() const { return reassembler_.writer(); }

  void set_error() { reassembler_.set_error(); }

private:
  uint64_t absolute_ackno() const;

  Reassembler reassembler_;

  std::optional<Wrap32> isn_ {};
  // the peer's initial sequence number, from its SYN
  // absolute seqno 0 is the SYN itself, so stream index i sits at seqno i + 1
};
