#include "debug.hh"

#include <iostream>
#include <mutex>

using namespace std;

namespace {
mutex& output_mutex()
{
  static mutex m;
  return m;
}
} // namespace

void debug_str( string_view message )
{
  const lock_guard lock( output_mutex() );
  cerr << "DEBUG: " << message << "\n";
}

void warn_str( string_view message )
{
  const lock_guard lock( output_mutex() );
  cerr << "WARNING: " << message << "\n";
}
