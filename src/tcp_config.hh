#pragma once

#include "wrapping_integers.hh"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>

// Config for TCP sender and receiver
class TCPConfig
{
public:
  static constexpr size_t DEFAULT_CAPACITY = 64000;     // Default send buffer capacity
  static constexpr size_t DEFAULT_RECV_CAPACITY = 4096; // Default receive buffer (bounds the advertised window)
  static constexpr size_t MAX_PAYLOAD_SIZE = 1000;      // Max payload per segment
  static constexpr uint16_t MAX_WINDOW = UINT16_MAX;    // Largest window the 16-bit field can advertise
  static constexpr uint64_t TIMEOUT_DFLT = 1000;        // Initial retransmission timeout is 1 second
  static constexpr uint64_t MIN_TIMEOUT = 200;          // Adaptive timeout never drops below this
  static constexpr uint64_t MAX_TIMEOUT = 60000;        // Backoff ceiling
  static constexpr unsigned MAX_RETX_ATTEMPTS = 8;      // Maximum re-transmit attempts before giving up
  static constexpr uint64_t TIME_WAIT_DFLT = 2000;      // How long TIME_WAIT lingers

  size_t mss = MAX_PAYLOAD_SIZE;
  uint64_t initial_rto_ms = TIMEOUT_DFLT; // RTO before the first round-trip sample
  uint64_t min_rto_ms = MIN_TIMEOUT;
  uint64_t max_rto_ms = MAX_TIMEOUT;
  uint64_t max_retransmissions = MAX_RETX_ATTEMPTS;
  size_t recv_capacity = DEFAULT_RECV_CAPACITY;
  size_t send_capacity = DEFAULT_CAPACITY;
  size_t send_window_cap = MAX_WINDOW; // local cap on unacknowledged bytes
  uint64_t time_wait_ms = TIME_WAIT_DFLT;
  std::optional<Wrap32> fixed_isn {};

  void validate() const
  {
    if ( mss == 0 ) {
      throw std::invalid_argument( "TCPConfig: mss must be positive" );
    }
    if ( min_rto_ms == 0 or min_rto_ms > max_rto_ms ) {
      throw std::invalid_argument( "TCPConfig: need 0 < min_rto_ms <= max_rto_ms" );
    }
    if ( send_capacity == 0 or send_window_cap == 0 ) {
      throw std::invalid_argument( "TCPConfig: send buffer and window cap must be positive" );
    }
  }
};
