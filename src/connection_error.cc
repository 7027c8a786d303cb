#include "connection_error.hh"

using namespace std;

ConnectionError::ConnectionError( const Cause cause, const string& what )
  : runtime_error( to_string( cause ) + ": " + what ), cause_( cause )
{}

string to_string( const ConnectionError::Cause cause )
{
  switch ( cause ) {
    case ConnectionError::Cause::RETRANSMISSION_LIMIT:
      return "retransmission limit exceeded";
    case ConnectionError::Cause::PEER_RESET:
      return "connection reset by peer";
    case ConnectionError::Cause::TIMED_OUT:
      return "timed out";
    case ConnectionError::Cause::NOT_CONNECTED:
      return "not connected";
  }
  return "unknown connection error";
}
