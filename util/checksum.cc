#include "checksum.hh"

#include <array>

using namespace std;

namespace {

constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr array<uint32_t, 256> make_crc32_table()
{
  array<uint32_t, 256> table {};
  for ( uint32_t i = 0; i < table.size(); i++ ) {
    uint32_t c = i;
    for ( int bit = 0; bit < 8; bit++ ) {
      c = ( c & 1 ) ? CRC32_POLYNOMIAL ^ ( c >> 1 ) : c >> 1;
    }
    table[i] = c;
  }
  return table;
}

constexpr array<uint32_t, 256> CRC32_TABLE = make_crc32_table();

} // namespace

void CRC32::add( const uint8_t byte )
{
  state_ = CRC32_TABLE[( state_ ^ byte ) & 0xFF] ^ ( state_ >> 8 );
}

void CRC32::add( const string_view data )
{
  for ( const char c : data ) {
    add( static_cast<uint8_t>( c ) );
  }
}
