#include "outstanding_queue.hh"

using namespace std;

void OutstandingQueue::push( OutstandingUnit unit )
{
  const uint64_t seqno = unit.seqno;
  units_.insert_or_assign( seqno, move( unit ) );
}

vector<OutstandingUnit> OutstandingQueue::acknowledge_through( const uint64_t ackno )
{
  vector<OutstandingUnit> removed;
  while ( not units_.empty() and units_.begin()->second.end() <= ackno ) {
    removed.push_back( move( units_.begin()->second ) );
    units_.erase( units_.begin() );
  }
  return removed;
}

bool OutstandingQueue::acknowledge_exactly( const uint64_t seqno )
{
  auto it = units_.find( seqno );
  if ( it == units_.end() or it->second.acknowledged ) {
    return false;
  }
  it->second.acknowledged = true;
  return true;
}

void OutstandingQueue::release_acknowledged_prefix()
{
  while ( not units_.empty() and units_.begin()->second.acknowledged ) {
    units_.erase( units_.begin() );
  }
}

OutstandingUnit* OutstandingQueue::find( const uint64_t seqno )
{
  auto it = units_.find( seqno );
  return it == units_.end() ? nullptr : &it->second;
}

OutstandingUnit* OutstandingQueue::oldest()
{
  return units_.empty() ? nullptr : &units_.begin()->second;
}

const OutstandingUnit* OutstandingQueue::oldest() const
{
  return units_.empty() ? nullptr : &units_.begin()->second;
}

uint64_t OutstandingQueue::sequence_numbers_in_flight() const
{
  uint64_t total = 0;
  for ( const auto& [seqno, unit] : units_ ) {
    if ( not unit.acknowledged ) {
      total += unit.length;
    }
  }
  return total;
}
