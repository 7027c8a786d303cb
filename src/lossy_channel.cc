#include "lossy_channel.hh"
#include "debug.hh"
#include "exception.hh"
#include "random.hh"

#include <algorithm>

using namespace std;

LossyChannel::LossyChannel( shared_ptr<DatagramChannel> inner, const LossProfile& profile )
  : inner_( notnull( "LossyChannel", move( inner ) ) ), profile_( profile ), rng_( get_random_engine( profile.seed ) )
{
  if ( profile_.min_delay_ms > profile_.max_delay_ms ) {
    throw invalid_argument( "LossProfile: min_delay_ms exceeds max_delay_ms" );
  }
  if ( profile_.max_delay_ms > 0 ) {
    releaser_ = thread( [this] { release_loop(); } );
  }
}

LossyChannel::~LossyChannel()
{
  {
    const lock_guard lock( mutex_ );
    stopping_ = true;
  }
  wakeup_.notify_all();
  if ( releaser_.joinable() ) {
    releaser_.join();
  }
}

void LossyChannel::send_datagram( const Address& destination, string payload )
{
  unique_lock lock( mutex_ );
  stats_.datagrams_sent++;

  bernoulli_distribution lose( profile_.loss_rate );
  bernoulli_distribution damage( profile_.corrupt_rate );
  bernoulli_distribution duplicate( profile_.duplicate_rate );

  if ( lose( rng_ ) ) {
    stats_.datagrams_lost++;
    debug( "channel: datagram #", stats_.datagrams_sent, " lost" );
    return;
  }

  if ( damage( rng_ ) ) {
    corrupt( payload );
    stats_.datagrams_corrupted++;
    debug( "channel: datagram #", stats_.datagrams_sent, " corrupted" );
  }

  const bool twice = duplicate( rng_ );
  if ( twice ) {
    stats_.datagrams_duplicated++;
  }

  if ( profile_.max_delay_ms == 0 ) {
    lock.unlock();
    if ( twice ) {
      inner_->send_datagram( destination, payload );
    }
    inner_->send_datagram( destination, move( payload ) );
    return;
  }

  if ( twice ) {
    schedule( destination, payload );
  }
  schedule( destination, move( payload ) );
  lock.unlock();
  wakeup_.notify_all();
}

void LossyChannel::corrupt( string& payload )
{
  if ( payload.empty() ) {
    return;
  }
  uniform_int_distribution<size_t> count_dist( 1, min<size_t>( 5, payload.size() ) );
  uniform_int_distribution<size_t> index_dist( 0, payload.size() - 1 );
  const size_t count = count_dist( rng_ );
  for ( size_t i = 0; i < count; i++ ) {
    payload[index_dist( rng_ )] ^= static_cast<char>( 0xFF );
  }
}

void LossyChannel::schedule( const Address& destination, string payload )
{
  uniform_int_distribution<uint64_t> delay_dist( profile_.min_delay_ms, profile_.max_delay_ms );
  const uint64_t delay = delay_dist( rng_ );
  stats_.total_delay_ms += delay;
  pending_.emplace( Clock::now() + chrono::milliseconds( delay ), Pending { destination, move( payload ) } );
}

void LossyChannel::release_loop()
{
  unique_lock lock( mutex_ );
  while ( not stopping_ ) {
    if ( pending_.empty() ) {
      wakeup_.wait( lock, [this] { return stopping_ or not pending_.empty(); } );
      continue;
    }

    const auto due = pending_.begin()->first;
    if ( Clock::now() < due ) {
      wakeup_.wait_until( lock, due );
      continue;
    }

    Pending next = move( pending_.begin()->second );
    pending_.erase( pending_.begin() );

    lock.unlock();
    try {
      inner_->send_datagram( next.destination, move( next.payload ) );
    } catch ( const exception& e ) {
      warn( "channel: delayed send failed: ", e.what() );
    }
    lock.lock();
  }
}

optional<Datagram> LossyChannel::receive_datagram( const chrono::milliseconds timeout )
{
  return inner_->receive_datagram( timeout );
}

LossyChannel::Statistics LossyChannel::statistics() const
{
  const lock_guard lock( mutex_ );
  return stats_;
}
