#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

enum class AckPolicy
{
  CUMULATIVE, // go-back-N: one timer, whole-window resend, in-order-only receiver
  SELECTIVE   // selective repeat: per-unit timers and acknowledgments, buffering receiver
};

inline std::string to_string( AckPolicy policy )
{
  return policy == AckPolicy::CUMULATIVE ? "cumulative" : "selective";
}

// Config for the windowed retransmission engine
struct WindowConfig
{
  static constexpr uint64_t DEFAULT_WINDOW = 4;
  static constexpr uint64_t TIMEOUT_DFLT = 1000; // retransmission timeout, in milliseconds
  static constexpr uint64_t MAX_RETX_ATTEMPTS = 8;

  AckPolicy policy = AckPolicy::CUMULATIVE;
  uint64_t window_size = DEFAULT_WINDOW;
  uint64_t rto_ms = TIMEOUT_DFLT;
  uint64_t max_retransmissions = MAX_RETX_ATTEMPTS;

  // Retransmit early after this many duplicate acknowledgments (0 = only on timeout)
  uint64_t duplicate_ack_threshold = 0;

  void validate() const
  {
    if ( window_size == 0 ) {
      throw std::invalid_argument( "WindowConfig: window_size must be at least 1" );
    }
    if ( rto_ms == 0 ) {
      throw std::invalid_argument( "WindowConfig: rto_ms must be positive" );
    }
  }
};
