#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

// Reads big-endian integers and byte strings out of a buffer.
// Any read past the end puts the parser into an error state instead of throwing;
// callers check has_error() once at the end.
class Parser
{
  std::string_view input_;
  bool error_ {};

  void check_size( size_t size );

public:
  explicit Parser( std::string_view input ) : input_( input ) {}

  bool has_error() const { return error_; }
  void set_error() { error_ = true; }
  size_t remaining() const { return input_.size(); }

  template<std::unsigned_integral T>
  void integer( T& out );

  // copy exactly `len` bytes
  void string( std::string& out, size_t len );

  // take whatever is left
  void all_remaining( std::string& out );
};

// Appends big-endian integers and byte strings to an output buffer.
class Serializer
{
  std::string output_ {};

public:
  template<std::unsigned_integral T>
  void integer( T val );

  void buffer( std::string_view buf ) { output_.append( buf ); }

  std::string finish() { return std::move( output_ ); }
  size_t size() const { return output_.size(); }
};

template<std::unsigned_integral T>
void Parser::integer( T& out )
{
  check_size( sizeof( T ) );
  if ( has_error() ) {
    return;
  }

  out = 0;
  for ( size_t i = 0; i < sizeof( T ); i++ ) {
    out <<= 8;
    out |= static_cast<uint8_t>( input_[i] );
  }
  input_.remove_prefix( sizeof( T ) );
}

template<std::unsigned_integral T>
void Serializer::integer( const T val )
{
  for ( size_t i = 0; i < sizeof( T ); i++ ) {
    const uint8_t byte = static_cast<uint8_t>( val >> ( ( sizeof( T ) - i - 1 ) * 8 ) );
    output_.push_back( static_cast<char>( byte ) );
  }
}
