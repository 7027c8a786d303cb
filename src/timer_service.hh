#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <utility>

/*
 * Per-key countdown timers sharing one time-ordered queue.
 *
 * Time is whatever the owner says it is: tick() advances the clock and fires every
 * timer whose deadline has passed, in deadline order. A background loop ticks it with
 * wall-clock time in production; tests tick it by hand.
 *
 * All timer state belongs to the owner's guard mutex. start/restart/cancel must be
 * called with the guard held; tick() takes the guard itself and runs callbacks while
 * holding it. A timer cancelled under the guard therefore can never fire afterwards,
 * even if its deadline has already passed on another thread.
 */
class TimerService
{
public:
  using Key = uint64_t;
  using Callback = std::function<void()>;

  explicit TimerService( std::mutex& guard ) : guard_( guard ) {}

  // Arm timer `key` to run `on_fire` after `duration_ms`. Replaces any live timer with the same key.
  void start( Key key, uint64_t duration_ms, Callback on_fire );

  // Re-arm an existing timer with a new duration, keeping its callback.
  // Returns false if the key was never started (or was cancelled).
  bool restart( Key key, uint64_t duration_ms );

  // Disarm and forget timer `key`. A no-op if it is not known.
  void cancel( Key key );
  void cancel_all();

  bool running( Key key ) const;
  uint64_t deadline( Key key ) const;
  size_t armed_count() const { return queue_.size(); }

  // Milliseconds of virtual time since construction.
  uint64_t now() const { return now_ms_; }

  // Advance time and fire due timers. Must be called without the guard held.
  void tick( uint64_t ms_since_last_tick );

private:
  struct Entry
  {
    Callback callback;
    uint64_t deadline {}; // absolute, in now() units
    bool armed {};        // a disarmed entry keeps its callback for restart()
  };

  void disarm( Entry& entry, Key key );

  std::mutex& guard_; // the owner's mutex; callbacks run with it held
  uint64_t now_ms_ {};
  std::map<Key, Entry> entries_ {}; // every key ever started
  std::set<std::pair<uint64_t, Key>> queue_ {}; // (deadline, key) of armed timers
};
