#include "timer_service.hh"

#include <algorithm>

using namespace std;

void TimerService::disarm( Entry& entry, const Key key )
{
  if ( entry.armed ) {
    queue_.erase( { entry.deadline, key } );
    entry.armed = false;
  }
}

void TimerService::start( const Key key, const uint64_t duration_ms, Callback on_fire )
{
  auto& entry = entries_[key];
  disarm( entry, key );

  entry.callback = move( on_fire );
  // a zero-length timer would refire forever within one tick
  entry.deadline = now_ms_ + max<uint64_t>( duration_ms, 1 );
  entry.armed = true;
  queue_.emplace( entry.deadline, key );
}

bool TimerService::restart( const Key key, const uint64_t duration_ms )
{
  auto it = entries_.find( key );
  if ( it == entries_.end() ) {
    return false;
  }

  auto& entry = it->second;
  disarm( entry, key );
  entry.deadline = now_ms_ + max<uint64_t>( duration_ms, 1 );
  entry.armed = true;
  queue_.emplace( entry.deadline, key );
  return true;
}

void TimerService::cancel( const Key key )
{
  auto it = entries_.find( key );
  if ( it == entries_.end() ) {
    return;
  }
  disarm( it->second, key );
  entries_.erase( it );
}

void TimerService::cancel_all()
{
  queue_.clear();
  entries_.clear();
}

bool TimerService::running( const Key key ) const
{
  auto it = entries_.find( key );
  return it != entries_.end() and it->second.armed;
}

uint64_t TimerService::deadline( const Key key ) const
{
  auto it = entries_.find( key );
  return ( it != entries_.end() and it->second.armed ) ? it->second.deadline : 0;
}

void TimerService::tick( const uint64_t ms_since_last_tick )
{
  const lock_guard lock( guard_ );
  now_ms_ += ms_since_last_tick;

  while ( not queue_.empty() and queue_.begin()->first <= now_ms_ ) {
    const Key key = queue_.begin()->second;
    auto& entry = entries_.at( key );
    disarm( entry, key );

    // the callback may cancel or restart its own key, so run a copy
    const Callback callback = entry.callback;
    if ( callback ) {
      callback();
    }
  }
}
