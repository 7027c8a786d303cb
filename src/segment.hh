#pragma once

#include "wrapping_integers.hh"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/*
 * The unit carried by one datagram, for both the windowed engine (seqno/ackno are packet
 * indices) and the connection layer (seqno/ackno are byte offsets).
 *
 * Wire layout, big endian:
 *   flags (1) | seqno (4) | ackno (4) | window (2) | checksum (4) | payload
 *
 * The checksum is a CRC-32 over every other byte of the encoding. A segment that parses
 * but whose checksum does not match is "corrupt": none of its fields may be trusted.
 */
struct Segment
{
  static constexpr uint8_t FLAG_FIN = 0x01;
  static constexpr uint8_t FLAG_SYN = 0x02;
  static constexpr uint8_t FLAG_RST = 0x04;
  static constexpr uint8_t FLAG_ACK = 0x10;
  static constexpr uint8_t KNOWN_FLAGS = FLAG_FIN | FLAG_SYN | FLAG_RST | FLAG_ACK;

  static constexpr size_t HEADER_LENGTH = 15;

  // Closed set of segment shapes; which one a buffer holds is decided once, by parse().
  enum class Kind : uint8_t
  {
    DATA,
    ACK,
    SYN,
    SYN_ACK,
    FIN,
    FIN_ACK,
    RST
  };

  uint8_t flags {};
  Wrap32 seqno { 0 };
  Wrap32 ackno { 0 };
  uint16_t window {};
  uint32_t checksum {};
  std::string payload {};

  bool has( uint8_t flag ) const { return ( flags & flag ) != 0; }
  Kind kind() const;

  // How many sequence numbers does this segment occupy? (payload, plus one each for SYN and FIN)
  size_t sequence_length() const { return payload.size() + has( FLAG_SYN ) + has( FLAG_FIN ); }

  uint32_t compute_checksum() const;
  void seal() { checksum = compute_checksum(); }
  bool is_corrupt() const { return checksum != compute_checksum(); }

  std::string serialize() const;
  std::string to_string() const;
};

// Parse `buffer` into `segment`. Returns false if the buffer is too short or carries
// an impossible flag combination. Does not check the checksum.
bool parse( Segment& segment, std::string_view buffer );

// true if `flags` is one of the combinations a Segment may carry
bool valid_flags( uint8_t flags );

std::string to_string( Segment::Kind kind );

// Why a received unit was thrown away
enum class DropReason : uint8_t
{
  MALFORMED,
  CORRUPT,
  DUPLICATE,
  OUT_OF_WINDOW,
  ILLEGAL_STATE
};

std::string to_string( DropReason reason );
