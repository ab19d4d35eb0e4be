#ifndef __ADBFWD_FORWARDER_EXCEPTION__
#define __ADBFWD_FORWARDER_EXCEPTION__

#include "Headers.hpp"

namespace adbfwd {
/**
 * @brief Categories of failure reported while starting a forwarding session.
 */
enum class ForwarderErrorKind {
  /** A process could not be started. */
  SPAWN_FAILURE,
  /** A forwarder printed an explicit error line. */
  HANDSHAKE_FAILURE,
  /** A forwarder closed its output before printing a decisive line. */
  UNEXPECTED_STREAM_END,
  /** No decisive line arrived within the wait budget. */
  HANDSHAKE_TIMEOUT,
  /** start() was called on a session that already ran. */
  SESSION_ALREADY_STARTED,
  /** Bad user input (ports, config values, paths). */
  INVALID_ARGUMENT,
  /** Never thrown: tags log lines about stale port owners. */
  PORT_CONFLICT_WARNING,
};

inline const char* errorKindToString(ForwarderErrorKind kind) {
  switch (kind) {
    case ForwarderErrorKind::SPAWN_FAILURE:
      return "SpawnFailure";
    case ForwarderErrorKind::HANDSHAKE_FAILURE:
      return "HandshakeFailure";
    case ForwarderErrorKind::UNEXPECTED_STREAM_END:
      return "UnexpectedStreamEnd";
    case ForwarderErrorKind::HANDSHAKE_TIMEOUT:
      return "HandshakeTimeout";
    case ForwarderErrorKind::SESSION_ALREADY_STARTED:
      return "SessionAlreadyStarted";
    case ForwarderErrorKind::INVALID_ARGUMENT:
      return "InvalidArgument";
    case ForwarderErrorKind::PORT_CONFLICT_WARNING:
      return "PortConflictWarning";
  }
  return "Unknown";
}

/**
 * @brief Thrown when a forwarding session cannot be established.
 */
class ForwarderException : public std::exception {
 public:
  ForwarderException(ForwarderErrorKind _kind, const string& msg)
      : kind(_kind),
        message(string(errorKindToString(_kind)) + ": " + msg),
        detail(msg) {}

  const char* what() const noexcept override { return message.c_str(); }

  ForwarderErrorKind getKind() const { return kind; }

  /** @brief The message without the kind prefix. */
  const string& getDetail() const { return detail; }

 private:
  ForwarderErrorKind kind;
  std::string message;
  std::string detail;
};
}  // namespace adbfwd

#endif  // __ADBFWD_FORWARDER_EXCEPTION__
