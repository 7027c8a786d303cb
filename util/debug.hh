#pragma once

#include <sstream>
#include <string_view>

// Print a debugging message to stderr, prefixed with "DEBUG: ".
// Compiled out entirely in release (NDEBUG) builds.
void debug_str( std::string_view message );

// Print a warning to stderr, prefixed with "WARNING: ". Always on.
void warn_str( std::string_view message );

template<typename... Args>
void debug( [[maybe_unused]] Args&&... args )
{
#ifndef NDEBUG
  std::ostringstream ss;
  ( ss << ... << args );
  debug_str( ss.str() );
#endif
}

template<typename... Args>
void warn( Args&&... args )
{
  std::ostringstream ss;
  ( ss << ... << args );
  warn_str( ss.str() );
}
