#include "HandshakeParser.hpp"

namespace adbfwd {
namespace {
const string DEVICE_SUCCESS_MARKER = "Starting Device Forwarder.";
const string DEVICE_ERROR_MARKER = ":ERROR:";
const string HOST_SUCCESS_PREFIX = "Forwarding device port ";
const string HOST_SUCCESS_INFIX = " to host ";
const string HOST_FAILURE_PREFIX =
    "Couldn't start forwarder server for port spec: ";

// Reads a run of digits at *pos and advances past it.
bool consumePort(const string& line, size_t* pos, int* port) {
  size_t end = *pos;
  while (end < line.length() && isdigit((unsigned char)line[end])) {
    end++;
  }
  if (end == *pos || end - *pos > 5) {
    return false;
  }
  int value = stoi(line.substr(*pos, end - *pos));
  if (value > 65535) {
    return false;
  }
  *port = value;
  *pos = end;
  return true;
}

bool consumeLiteral(const string& line, size_t* pos, const string& literal) {
  if (line.compare(*pos, literal.length(), literal) != 0) {
    return false;
  }
  *pos += literal.length();
  return true;
}

HandshakeOutcome hostOutcome(HandshakeStatus status, int devicePort,
                             int hostPort) {
  HandshakeOutcome outcome;
  outcome.status = status;
  outcome.devicePort = devicePort;
  outcome.hostPort = hostPort;
  return outcome;
}
}  // namespace

const char* handshakeStatusToString(HandshakeStatus status) {
  switch (status) {
    case HandshakeStatus::SUCCESS:
      return "SUCCESS";
    case HandshakeStatus::FAILURE:
      return "FAILURE";
    case HandshakeStatus::STREAM_CLOSED:
      return "STREAM_CLOSED";
    case HandshakeStatus::TIMED_OUT:
      return "TIMED_OUT";
    case HandshakeStatus::NO_MATCH:
      return "NO_MATCH";
  }
  return "UNKNOWN";
}

HandshakeOutcome parseDeviceForwarderLine(const string& line) {
  HandshakeOutcome outcome;
  if (line.find(DEVICE_SUCCESS_MARKER) != string::npos) {
    outcome.status = HandshakeStatus::SUCCESS;
    return outcome;
  }
  // The marker is preceded by the logging prefix of the device binary; the
  // message is whatever follows its last occurrence.
  auto errorIndex = line.rfind(DEVICE_ERROR_MARKER);
  if (errorIndex != string::npos) {
    outcome.status = HandshakeStatus::FAILURE;
    outcome.message = line.substr(errorIndex + DEVICE_ERROR_MARKER.length());
  }
  return outcome;
}

HandshakeOutcome parseHostForwarderLine(const string& line) {
  auto successIndex = line.find(HOST_SUCCESS_PREFIX);
  if (successIndex != string::npos) {
    size_t pos = successIndex + HOST_SUCCESS_PREFIX.length();
    int devicePort, hostPort;
    if (consumePort(line, &pos, &devicePort) &&
        consumeLiteral(line, &pos, HOST_SUCCESS_INFIX) &&
        consumePort(line, &pos, &hostPort) &&
        consumeLiteral(line, &pos, ":")) {
      return hostOutcome(HandshakeStatus::SUCCESS, devicePort, hostPort);
    }
  }

  auto failureIndex = line.find(HOST_FAILURE_PREFIX);
  if (failureIndex != string::npos) {
    size_t pos = failureIndex + HOST_FAILURE_PREFIX.length();
    int devicePort, hostPort;
    if (consumePort(line, &pos, &devicePort) &&
        consumeLiteral(line, &pos, ":") &&
        consumePort(line, &pos, &hostPort)) {
      return hostOutcome(HandshakeStatus::FAILURE, devicePort, hostPort);
    }
  }
  return HandshakeOutcome();
}

HandshakeOutcome expectOutcome(ProcessHandle* process,
                               const LineGrammar& grammar, int64_t timeoutMs) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  string before;
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                         deadline - std::chrono::steady_clock::now())
                         .count();
    HandshakeOutcome outcome;
    string line;
    LineStatus lineStatus = LineStatus::TIMED_OUT;
    if (remaining > 0) {
      lineStatus = process->readLine(&line, remaining);
    }
    switch (lineStatus) {
      case LineStatus::LINE:
        outcome = grammar(line);
        if (!outcome.isDecisive()) {
          VLOG(1) << process->getDescription() << ": " << line;
          before += line + "\n";
          continue;
        }
        break;
      case LineStatus::STREAM_CLOSED:
        outcome.status = HandshakeStatus::STREAM_CLOSED;
        break;
      case LineStatus::TIMED_OUT:
        outcome.status = HandshakeStatus::TIMED_OUT;
        break;
    }
    outcome.before = before;
    return outcome;
  }
}
}  // namespace adbfwd
