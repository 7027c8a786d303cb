#include "wrapping_integers.hh"

using namespace std;

Wrap32 Wrap32::wrap( uint64_t n, Wrap32 zero_point )
{
  return Wrap32( static_cast<uint32_t>( n + zero_point.raw_value_ ) );
}

uint64_t Wrap32::unwrap( Wrap32 zero_point, uint64_t checkpoint ) const
{
  // offset of this value from the zero point, within one 2^32 "era"
  const uint32_t offset = raw_value_ - zero_point.raw_value_;

  const uint64_t checkpoint_era = checkpoint >> 32;

  // candidates in the checkpoint's era and its two neighbors
  const uint64_t same = ( checkpoint_era << 32 ) + offset;
  const uint64_t next = ( ( checkpoint_era + 1 ) << 32 ) + offset;
  const uint64_t prev = checkpoint_era > 0 ? ( ( checkpoint_era - 1 ) << 32 ) + offset : same;

  auto distance = [checkpoint]( uint64_t candidate ) {
    return checkpoint > candidate ? checkpoint - candidate : candidate - checkpoint;
  };

  const uint64_t d_same = distance( same );
  const uint64_t d_next = distance( next );
  const uint64_t d_prev = distance( prev );

  if ( d_same <= d_next and d_same <= d_prev ) {
    return same;
  }
  if ( d_next <= d_same and d_next <= d_prev ) {
    return next;
  }
  return prev;
}
