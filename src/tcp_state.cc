#include "tcp_state.hh"

using namespace std;

optional<TCPTransition> find_transition( const TCPState state, const TCPEvent event )
{
  for ( const auto& transition : TCP_TRANSITIONS ) {
    if ( transition.from == state and transition.event == event ) {
      return transition;
    }
  }
  return nullopt;
}

string to_string( const TCPState state )
{
  switch ( state ) {
    case TCPState::CLOSED:
      return "CLOSED";
    case TCPState::LISTEN:
      return "LISTEN";
    case TCPState::SYN_SENT:
      return "SYN_SENT";
    case TCPState::SYN_RCVD:
      return "SYN_RCVD";
    case TCPState::ESTABLISHED:
      return "ESTABLISHED";
    case TCPState::FIN_WAIT_1:
      return "FIN_WAIT_1";
    case TCPState::FIN_WAIT_2:
      return "FIN_WAIT_2";
    case TCPState::CLOSING:
      return "CLOSING";
    case TCPState::TIME_WAIT:
      return "TIME_WAIT";
    case TCPState::CLOSE_WAIT:
      return "CLOSE_WAIT";
    case TCPState::LAST_ACK:
      return "LAST_ACK";
  }
  return "UNKNOWN";
}

string to_string( const TCPEvent event )
{
  switch ( event ) {
    case TCPEvent::LISTEN:
      return "listen";
    case TCPEvent::CONNECT:
      return "connect";
    case TCPEvent::CLOSE:
      return "close";
    case TCPEvent::RECV_SYN:
      return "recv SYN";
    case TCPEvent::RECV_SYN_ACK:
      return "recv SYN-ACK";
    case TCPEvent::RECV_ACK:
      return "recv ACK";
    case TCPEvent::RECV_FIN:
      return "recv FIN";
    case TCPEvent::TIMEOUT:
      return "timeout";
  }
  return "unknown";
}

string to_string( const TCPAction action )
{
  switch ( action ) {
    case TCPAction::NONE:
      return "none";
    case TCPAction::SEND_SYN:
      return "send SYN";
    case TCPAction::SEND_SYN_ACK:
      return "send SYN-ACK";
    case TCPAction::SEND_ACK:
      return "send ACK";
    case TCPAction::SEND_FIN:
      return "send FIN";
  }
  return "unknown";
}
