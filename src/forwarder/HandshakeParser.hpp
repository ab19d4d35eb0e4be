#ifndef __ADBFWD_HANDSHAKE_PARSER__
#define __ADBFWD_HANDSHAKE_PARSER__

#include "Headers.hpp"
#include "ProcessHandle.hpp"

namespace adbfwd {
enum class HandshakeStatus {
  SUCCESS,
  FAILURE,
  STREAM_CLOSED,
  TIMED_OUT,
  /** The line is not part of the handshake grammar. */
  NO_MATCH,
};

const char* handshakeStatusToString(HandshakeStatus status);

/**
 * @brief Typed result of interpreting forwarder output.
 */
struct HandshakeOutcome {
  HandshakeStatus status = HandshakeStatus::NO_MATCH;
  /** Error text of a device forwarder FAILURE. */
  string message;
  /** Ports named by a host forwarder SUCCESS or FAILURE line. */
  int devicePort = -1;
  int hostPort = -1;
  /** Output consumed before the decisive line, for diagnostics. */
  string before;

  bool isDecisive() const { return status != HandshakeStatus::NO_MATCH; }
};

typedef std::function<HandshakeOutcome(const string&)> LineGrammar;

/**
 * @brief Interprets one line printed by the device forwarder at startup.
 *
 * "Starting Device Forwarder." is SUCCESS, "<anything>:ERROR:<message>" is
 * FAILURE carrying <message>. Everything else is NO_MATCH.
 */
HandshakeOutcome parseDeviceForwarderLine(const string& line);

/**
 * @brief Interprets one line printed by the host forwarder.
 *
 * "Forwarding device port D to host H:" is SUCCESS(D, H) and
 * "Couldn't start forwarder server for port spec: D:H" is FAILURE(D, H).
 */
HandshakeOutcome parseHostForwarderLine(const string& line);

/**
 * @brief Reads lines from `process` until `grammar` yields a decisive outcome.
 *
 * Lines the grammar does not recognize are skipped. `timeoutMs` bounds the
 * whole wait, not each line. Never returns NO_MATCH.
 */
HandshakeOutcome expectOutcome(ProcessHandle* process,
                               const LineGrammar& grammar, int64_t timeoutMs);
}  // namespace adbfwd

#endif  // __ADBFWD_HANDSHAKE_PARSER__
