#pragma once

#include "segment.hh"

#include <cstdint>
#include <map>
#include <vector>

// One transmitted-but-unacknowledged unit on the sending side.
// For the windowed engine a unit is one packet (length 1); for the connection layer
// it is a byte range (length = payload bytes, plus one for SYN and FIN).
struct OutstandingUnit
{
  uint64_t seqno {};   // absolute sequence number of the first slot
  uint64_t length {};  // sequence numbers occupied
  Segment segment {};  // exactly what went out, for retransmission
  uint64_t sent_at {}; // time of the original transmission
  uint64_t retransmissions {};
  uint64_t loss_signals {}; // duplicate feedback seen while this unit was the oldest
  bool acknowledged {};

  uint64_t end() const { return seqno + length; }
};

// Sender-owned record of in-flight units, ordered by sequence number.
class OutstandingQueue
{
public:
  void push( OutstandingUnit unit );

  // Cumulative acknowledgment: remove every unit that ends at or before `ackno`.
  // Returns the removed units, oldest first.
  std::vector<OutstandingUnit> acknowledge_through( uint64_t ackno );

  // Selective acknowledgment: mark the unit starting at `seqno`.
  // Returns false if there is no such unit or it was already acknowledged.
  bool acknowledge_exactly( uint64_t seqno );

  // Drop the contiguous run of acknowledged units at the front.
  void release_acknowledged_prefix();

  OutstandingUnit* find( uint64_t seqno );
  OutstandingUnit* oldest();
  const OutstandingUnit* oldest() const;

  bool empty() const { return units_.empty(); }
  size_t size() const { return units_.size(); }
  void clear() { units_.clear(); }

  // total length of units not yet acknowledged
  uint64_t sequence_numbers_in_flight() const;

  auto begin() { return units_.begin(); }
  auto end() { return units_.end(); }
  auto begin() const { return units_.begin(); }
  auto end() const { return units_.end(); }

private:
  std::map<uint64_t, OutstandingUnit> units_ {};
};
