#pragma once

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

// std::system_error plus the name of what caused it
class tagged_error : public std::system_error
{
private:
  std::string attempt_and_error_;
  int error_code_;

public:
  tagged_error( const std::error_category& category, const std::string_view s_attempt, const int error_code )
    : system_error( error_code, category )
    , attempt_and_error_( std::string( s_attempt ) + ": " + std::system_error::what() )
    , error_code_( error_code )
  {}

  const char* what() const noexcept override { return attempt_and_error_.c_str(); }

  int error_code() const { return error_code_; }
};

// a tagged_error for syscalls
class unix_error : public tagged_error
{
public:
  explicit unix_error( const std::string_view s_attempt, const int s_errno = errno )
    : tagged_error( std::system_category(), s_attempt, s_errno )
  {}
};

// error-checking wrapper for most syscalls
inline int CheckSystemCall( const std::string_view s_attempt, const int return_value )
{
  if ( return_value >= 0 ) {
    return return_value;
  }

  throw unix_error { s_attempt };
}

// version of CheckSystemCall that takes a pointer
template<typename T>
inline T* CheckSystemCall( const std::string_view s_attempt, T* return_value )
{
  if ( return_value ) {
    return return_value;
  }

  throw unix_error { s_attempt };
}

// fail loudly if a required shared pointer is missing
template<typename T>
inline std::shared_ptr<T> notnull( const std::string_view context, std::shared_ptr<T> x )
{
  if ( not x ) {
    throw std::runtime_error( std::string( context ) + ": unexpected null pointer" );
  }
  return x;
}
