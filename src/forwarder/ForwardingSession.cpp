#include "ForwardingSession.hpp"

#include "HandshakeParser.hpp"
#include "PortPairUtils.hpp"

namespace adbfwd {
namespace {
string describePortPairs(const vector<PortPair>& portPairs) {
  std::ostringstream ss;
  ss << "[";
  for (size_t a = 0; a < portPairs.size(); a++) {
    if (a) {
      ss << ", ";
    }
    ss << portPairs[a];
  }
  ss << "]";
  return ss.str();
}

void logConsumedOutput(const string& processName,
                       const HandshakeOutcome& outcome) {
  if (!outcome.before.empty()) {
    LOG(ERROR) << processName << " output:\n" << outcome.before;
  }
}
}  // namespace

const char* sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::INITIALIZING:
      return "Initializing";
    case SessionState::AWAITING_DEVICE_ACK:
      return "AwaitingDeviceAck";
    case SessionState::AWAITING_HOST_ACKS:
      return "AwaitingHostAcks";
    case SessionState::ACTIVE:
      return "Active";
    case SessionState::CLOSED:
      return "Closed";
    case SessionState::FAILED:
      return "Failed";
  }
  return "Unknown";
}

ForwardingSession::ForwardingSession(
    shared_ptr<DeviceShell> _deviceShell,
    shared_ptr<SubprocessUtils> _subprocessUtils,
    shared_ptr<PortAllocator> _portAllocator, const ForwarderConfig& _config)
    : deviceShell(_deviceShell),
      portAllocator(_portAllocator),
      config(_config),
      supervisor(_subprocessUtils, _config.adbPath),
      state(SessionState::INITIALIZING),
      controlPort(0) {}

ForwardingSession::~ForwardingSession() { close(); }

unique_ptr<ForwardingSession> ForwardingSession::open(
    shared_ptr<DeviceShell> deviceShell,
    shared_ptr<SubprocessUtils> subprocessUtils,
    shared_ptr<PortAllocator> portAllocator, const ForwarderConfig& config,
    const vector<PortPair>& portPairs) {
  unique_ptr<ForwardingSession> session(new ForwardingSession(
      deviceShell, subprocessUtils, portAllocator, config));
  session->start(portPairs);
  return session;
}

void ForwardingSession::validatePortPairs(
    const vector<PortPair>& portPairs) const {
  if (portPairs.empty()) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             "No port pairs to forward");
  }
  set<int> hostPorts;
  for (auto& pp : portPairs) {
    if (pp.device_port() < 0 || pp.device_port() > 65535 ||
        pp.host_port() <= 0 || pp.host_port() > 65535) {
      std::ostringstream ss;
      ss << "Invalid port pair " << pp;
      throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT, ss.str());
    }
    if (!hostPorts.insert(pp.host_port()).second) {
      throw ForwarderException(
          ForwarderErrorKind::INVALID_ARGUMENT,
          "Host port " + to_string(pp.host_port()) + " requested twice");
    }
  }
  config.validate();
}

void ForwardingSession::start(const vector<PortPair>& portPairs) {
  if (state != SessionState::INITIALIZING) {
    throw ForwarderException(ForwarderErrorKind::SESSION_ALREADY_STARTED,
                             string("Session is ") +
                                 sessionStateToString(state) +
                                 ", close it and open a new one");
  }
  validatePortPairs(portPairs);

  try {
    string serial = deviceShell->getSerialNumber();
    controlPort = portAllocator->allocateLocalPort();
    deviceShell->pushFileIfNeeded(config.getLocalDeviceForwarderPath(),
                                  config.deviceForwarderPath);
    vector<string> specs = encodePortPairSpecs(portPairs, config.bindAddress);
    LOG(INFO) << "[" << serial << "] Forwarding ports: " << join(specs, " ");

    // Kill off any existing device forwarders on conflicting non-dynamically
    // allocated ports.
    for (auto& pp : portPairs) {
      if (pp.device_port() != 0) {
        reclaimDevicePort(pp.device_port());
      }
    }
    supervisor.killStaleHostForwarders(config.getHostForwarderPath());

    controlTunnelProcess = supervisor.spawnControlTunnel(
        serial, controlPort, config.deviceSocketName);
    state = SessionState::AWAITING_DEVICE_ACK;
    deviceForwarderProcess = supervisor.spawnDeviceForwarder(
        serial, config.toolWrapperPrefix, config.deviceForwarderPath,
        config.deviceSocketName);
    awaitDeviceForwarder();

    state = SessionState::AWAITING_HOST_ACKS;
    hostForwarderProcess = supervisor.spawnHostForwarder(
        config.getHostForwarderPath(), controlPort, specs);
    PortMappingTable pendingMapping;
    awaitHostAcknowledgements(portPairs, &pendingMapping);

    portMapping = pendingMapping;
    portMapping.seal();
    state = SessionState::ACTIVE;
    LOG(INFO) << "[" << serial << "] Forwarding session active, control port "
              << controlPort;
  } catch (const ForwarderException& ex) {
    fail(ex);
    throw;
  } catch (const std::exception& ex) {
    ForwarderException wrapped(ForwarderErrorKind::SPAWN_FAILURE, ex.what());
    fail(wrapped);
    throw wrapped;
  }
}

void ForwardingSession::reclaimDevicePort(int devicePort) {
  const char* warning =
      errorKindToString(ForwarderErrorKind::PORT_CONFLICT_WARNING);
  vector<DeviceProcess> processes;
  try {
    processes = deviceShell->processesUsingDevicePort(devicePort);
  } catch (const ForwarderException& ex) {
    LOG(WARNING) << warning << ": could not list processes using device port "
                 << devicePort << ": " << ex.what();
    return;
  }
  for (auto& process : processes) {
    if (process.name() == config.getDeviceForwarderName()) {
      LOG(WARNING) << "Killing forwarder process with pid " << process.pid()
                   << " using device port " << devicePort;
      try {
        deviceShell->runShellCommand("kill " + to_string(process.pid()));
      } catch (const ForwarderException& ex) {
        LOG(WARNING) << warning << ": could not kill pid " << process.pid()
                     << ": " << ex.what();
      }
    } else {
      LOG(ERROR) << warning << ": not killing process with pid "
                 << process.pid() << " (" << process.name()
                 << ") using device port " << devicePort;
    }
  }
}

void ForwardingSession::awaitDeviceForwarder() {
  HandshakeOutcome outcome =
      expectOutcome(deviceForwarderProcess.get(), parseDeviceForwarderLine,
                    config.handshakeTimeoutMs);
  switch (outcome.status) {
    case HandshakeStatus::SUCCESS:
      LOG(INFO) << "Device forwarder started";
      return;
    case HandshakeStatus::FAILURE:
      logConsumedOutput("Device forwarder", outcome);
      throw ForwarderException(
          ForwarderErrorKind::HANDSHAKE_FAILURE,
          "Failed to start Device Forwarder with Error: " + outcome.message);
    case HandshakeStatus::STREAM_CLOSED:
      logConsumedOutput("Device forwarder", outcome);
      throw ForwarderException(
          ForwarderErrorKind::UNEXPECTED_STREAM_END,
          "Unexpected EOF while trying to start Device Forwarder.");
    case HandshakeStatus::TIMED_OUT:
      logConsumedOutput("Device forwarder", outcome);
      throw ForwarderException(ForwarderErrorKind::HANDSHAKE_TIMEOUT,
                               "Timeout while trying to start Device Forwarder");
    case HandshakeStatus::NO_MATCH:
      break;
  }
  STFATAL << "expectOutcome returned an indecisive outcome";
}

void ForwardingSession::awaitHostAcknowledgements(
    const vector<PortPair>& portPairs, PortMappingTable* pendingMapping) {
  // One acknowledgement per pair, in the order the pairs were requested.
  for (auto& pp : portPairs) {
    HandshakeOutcome outcome =
        expectOutcome(hostForwarderProcess.get(), parseHostForwarderLine,
                      config.handshakeTimeoutMs);
    switch (outcome.status) {
      case HandshakeStatus::SUCCESS:
        if (outcome.hostPort != pp.host_port() ||
            (pp.device_port() != 0 &&
             outcome.devicePort != pp.device_port())) {
          std::ostringstream ss;
          ss << "Unexpected acknowledgement for device port "
             << outcome.devicePort << " to host port " << outcome.hostPort
             << " while waiting for " << pp;
          throw ForwarderException(ForwarderErrorKind::HANDSHAKE_FAILURE,
                                   ss.str());
        }
        pendingMapping->record(outcome.hostPort, outcome.devicePort);
        LOG(INFO) << "Forwarding device port: " << outcome.devicePort
                  << " to host port: " << outcome.hostPort << ".";
        break;
      case HandshakeStatus::FAILURE: {
        logConsumedOutput("Host forwarder", outcome);
        std::ostringstream ss;
        ss << "Failed to forward port " << outcome.devicePort << " to "
           << outcome.hostPort;
        if (outcome.hostPort != pp.host_port() ||
            (pp.device_port() != 0 &&
             outcome.devicePort != pp.device_port())) {
          ss << " while waiting for " << pp;
        }
        throw ForwarderException(ForwarderErrorKind::HANDSHAKE_FAILURE,
                                 ss.str());
      }
      case HandshakeStatus::STREAM_CLOSED:
        logConsumedOutput("Host forwarder", outcome);
        throw ForwarderException(ForwarderErrorKind::UNEXPECTED_STREAM_END,
                                 "Unexpected EOF while trying to forward ports " +
                                     describePortPairs(portPairs));
      case HandshakeStatus::TIMED_OUT:
        logConsumedOutput("Host forwarder", outcome);
        throw ForwarderException(ForwarderErrorKind::HANDSHAKE_TIMEOUT,
                                 "Timeout while trying to forward ports " +
                                     describePortPairs(portPairs));
      case HandshakeStatus::NO_MATCH:
        STFATAL << "expectOutcome returned an indecisive outcome";
    }
  }
}

optional<int> ForwardingSession::lookup(int hostPort) const {
  if (state != SessionState::ACTIVE) {
    return nullopt;
  }
  return portMapping.lookup(hostPort);
}

void ForwardingSession::fail(const ForwarderException& ex) {
  state = SessionState::FAILED;
  LOG(ERROR) << "Forwarding session failed: " << ex.what();
  killAllProcesses();
  releaseControlPort();
  portMapping.clear();
  state = SessionState::CLOSED;
}

void ForwardingSession::close() {
  if (state == SessionState::CLOSED) {
    return;
  }
  if (state != SessionState::INITIALIZING) {
    LOG(INFO) << "Closing forwarding session on control port " << controlPort;
  }
  killAllProcesses();
  releaseControlPort();
  portMapping.clear();
  state = SessionState::CLOSED;
}

void ForwardingSession::killAllProcesses() {
  ProcessSupervisor::killAll(
      {hostForwarderProcess, deviceForwarderProcess, controlTunnelProcess});
  hostForwarderProcess.reset();
  deviceForwarderProcess.reset();
  controlTunnelProcess.reset();
}

void ForwardingSession::releaseControlPort() {
  if (controlPort == 0) {
    return;
  }
  portAllocator->releaseLocalPort(uint16_t(controlPort));
  controlPort = 0;
}
}  // namespace adbfwd
