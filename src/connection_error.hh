#pragma once

#include <stdexcept>
#include <string>

// A failure of the connection as a whole, reported to the application.
// Everything short of this (loss, corruption, reordering, duplication) is absorbed below.
class ConnectionError : public std::runtime_error
{
public:
  enum class Cause
  {
    RETRANSMISSION_LIMIT,
    PEER_RESET,
    TIMED_OUT,
    NOT_CONNECTED
  };

  ConnectionError( Cause cause, const std::string& what );

  Cause cause() const { return cause_; }

private:
  Cause cause_;
};

std::string to_string( ConnectionError::Cause cause );
