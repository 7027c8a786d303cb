#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class TCPState : uint8_t
{
  CLOSED,
  LISTEN,
  SYN_SENT,
  SYN_RCVD,
  ESTABLISHED,
  FIN_WAIT_1,
  FIN_WAIT_2,
  CLOSING,
  TIME_WAIT,
  CLOSE_WAIT,
  LAST_ACK
};

enum class TCPEvent : uint8_t
{
  LISTEN,       // application: passive open
  CONNECT,      // application: active open
  CLOSE,        // application: no more data to send
  RECV_SYN,     // peer's SYN arrived
  RECV_SYN_ACK, // peer's SYN arrived acknowledging ours
  RECV_ACK,     // our SYN or FIN has been acknowledged
  RECV_FIN,     // peer's FIN arrived, in order
  TIMEOUT       // TIME_WAIT lingered long enough
};

enum class TCPAction : uint8_t
{
  NONE,
  SEND_SYN,
  SEND_SYN_ACK,
  SEND_ACK,
  SEND_FIN
};

struct TCPTransition
{
  TCPState from;
  TCPEvent event;
  TCPState to;
  TCPAction action;
};

inline constexpr size_t TCP_STATE_COUNT = 11;
inline constexpr size_t TCP_EVENT_COUNT = 8;

// Every legal (state, event) pair. Anything not listed leaves the state unchanged.
// Aborts (RST, retransmission limit) bypass the table and go straight to CLOSED.
inline constexpr std::array<TCPTransition, 16> TCP_TRANSITIONS { {
  { TCPState::CLOSED, TCPEvent::LISTEN, TCPState::LISTEN, TCPAction::NONE },
  { TCPState::CLOSED, TCPEvent::CONNECT, TCPState::SYN_SENT, TCPAction::SEND_SYN },
  { TCPState::LISTEN, TCPEvent::RECV_SYN, TCPState::SYN_RCVD, TCPAction::SEND_SYN_ACK },
  { TCPState::LISTEN, TCPEvent::CLOSE, TCPState::CLOSED, TCPAction::NONE },
  { TCPState::SYN_SENT, TCPEvent::RECV_SYN_ACK, TCPState::ESTABLISHED, TCPAction::SEND_ACK },
  { TCPState::SYN_SENT, TCPEvent::CLOSE, TCPState::CLOSED, TCPAction::NONE },
  { TCPState::SYN_RCVD, TCPEvent::RECV_ACK, TCPState::ESTABLISHED, TCPAction::NONE },
  { TCPState::ESTABLISHED, TCPEvent::RECV_FIN, TCPState::CLOSE_WAIT, TCPAction::SEND_ACK },
  { TCPState::ESTABLISHED, TCPEvent::CLOSE, TCPState::FIN_WAIT_1, TCPAction::SEND_FIN },
  { TCPState::CLOSE_WAIT, TCPEvent::CLOSE, TCPState::LAST_ACK, TCPAction::SEND_FIN },
  { TCPState::LAST_ACK, TCPEvent::RECV_ACK, TCPState::CLOSED, TCPAction::NONE },
  { TCPState::FIN_WAIT_1, TCPEvent::RECV_ACK, TCPState::FIN_WAIT_2, TCPAction::NONE },
  { TCPState::FIN_WAIT_1, TCPEvent::RECV_FIN, TCPState::CLOSING, TCPAction::SEND_ACK },
  { TCPState::CLOSING, TCPEvent::RECV_ACK, TCPState::TIME_WAIT, TCPAction::NONE },
  { TCPState::FIN_WAIT_2, TCPEvent::RECV_FIN, TCPState::TIME_WAIT, TCPAction::SEND_ACK },
  { TCPState::TIME_WAIT, TCPEvent::TIMEOUT, TCPState::CLOSED, TCPAction::NONE },
} };

// The transition for (state, event), or nothing if the event is not legal in that state.
std::optional<TCPTransition> find_transition( TCPState state, TCPEvent event );

std::string to_string( TCPState state );
std::string to_string( TCPEvent event );
std::string to_string( TCPAction action );
