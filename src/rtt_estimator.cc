#include "rtt_estimator.hh"

#include <algorithm>
#include <cmath>

using namespace std;

namespace {
constexpr double ALPHA = 0.125;
constexpr double BETA = 0.25;
} // namespace

// The initial timeout is split as estimated + 4 * dev with dev = estimated / 2.
RTTEstimator::RTTEstimator( uint64_t initial_rto_ms, uint64_t min_rto_ms, uint64_t max_rto_ms )
  : min_rto_ms_( min_rto_ms )
  , max_rto_ms_( max_rto_ms )
  , rto_ms_( clamp( static_cast<double>( initial_rto_ms ) ) )
  , estimated_rtt_ms_( static_cast<double>( initial_rto_ms ) / 3 )
  , dev_rtt_ms_( static_cast<double>( initial_rto_ms ) / 6 )
{}

uint64_t RTTEstimator::clamp( double rto ) const
{
  const auto rounded = static_cast<uint64_t>( ceil( rto ) );
  return std::clamp( rounded, min_rto_ms_, max_rto_ms_ );
}

void RTTEstimator::add_sample( uint64_t sample_ms )
{
  const auto sample = static_cast<double>( sample_ms );

  estimated_rtt_ms_ = ( 1 - ALPHA ) * estimated_rtt_ms_ + ALPHA * sample;
  dev_rtt_ms_ = ( 1 - BETA ) * dev_rtt_ms_ + BETA * fabs( sample - estimated_rtt_ms_ );
  samples_++;

  rto_ms_ = clamp( estimated_rtt_ms_ + 4 * dev_rtt_ms_ );
}

void RTTEstimator::back_off()
{
  rto_ms_ = min( rto_ms_ * 2, max_rto_ms_ );
}
