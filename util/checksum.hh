#pragma once

#include <cstdint>
#include <string_view>

// Incremental CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320).
// Feed any number of buffers with add(), then read value().
class CRC32
{
  uint32_t state_ { 0xFFFFFFFF };

public:
  void add( std::string_view data );
  void add( uint8_t byte );

  uint32_t value() const { return ~state_; }
};
