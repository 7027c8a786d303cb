#pragma once

#include <cstdint>

/*
 * Adaptive retransmission timeout.
 *
 * Starts from estimated = initial / 3 and dev = estimated / 2, which add up to the
 * initial timeout. Every sample then does
 *   estimated = 0.875 * estimated + 0.125 * sample
 *   dev       = 0.75  * dev       + 0.25  * |sample - estimated|
 * and the timeout becomes estimated + 4 * dev, clamped to [min, max]. A timeout doubles
 * the current value (up to max) until the next sample recomputes it.
 */
class RTTEstimator
{
public:
  RTTEstimator( uint64_t initial_rto_ms, uint64_t min_rto_ms, uint64_t max_rto_ms );

  void add_sample( uint64_t sample_ms );
  void back_off();

  uint64_t rto_ms() const { return rto_ms_; }
  double estimated_rtt_ms() const { return estimated_rtt_ms_; }
  double dev_rtt_ms() const { return dev_rtt_ms_; }
  uint64_t samples() const { return samples_; }

private:
  uint64_t clamp( double rto ) const;

  uint64_t min_rto_ms_;
  uint64_t max_rto_ms_;
  uint64_t rto_ms_;
  double estimated_rtt_ms_ {};
  double dev_rtt_ms_ {};
  uint64_t samples_ {};
};
