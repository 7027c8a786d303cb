#include "random.hh"

#include <array>

using namespace std;

mt19937 get_random_engine( const optional<uint32_t> seed )
{
  if ( seed.has_value() ) {
    return mt19937 { *seed };
  }

  auto rd = random_device();
  array<uint32_t, mt19937::state_size> seed_data {};
  for ( auto& x : seed_data ) {
    x = rd();
  }
  seed_seq seeds( seed_data.begin(), seed_data.end() );
  return mt19937 { seeds };
}
