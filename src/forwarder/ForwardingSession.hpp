#ifndef __ADBFWD_FORWARDING_SESSION__
#define __ADBFWD_FORWARDING_SESSION__

#include "DeviceShell.hpp"
#include "ForwarderConfig.hpp"
#include "ForwarderException.hpp"
#include "Headers.hpp"
#include "PortAllocator.hpp"
#include "PortMappingTable.hpp"
#include "ProcessSupervisor.hpp"
#include "SubprocessUtils.hpp"

namespace adbfwd {
enum class SessionState {
  INITIALIZING,
  AWAITING_DEVICE_ACK,
  AWAITING_HOST_ACKS,
  ACTIVE,
  CLOSED,
  FAILED,
};

const char* sessionStateToString(SessionState state);

/**
 * @brief Reverse forwards device ports to host ports.
 *
 * Works like `adb forward`, in reverse: a device forwarder started through
 * adb listens on the requested device ports and relays connections over a
 * control channel to a host forwarder, which connects them to the host
 * ports. start() blocks until both forwarders have acknowledged every pair
 * or throws ForwarderException after tearing everything down.
 *
 * A session is driven from a single thread.
 */
class ForwardingSession {
 public:
  ForwardingSession(shared_ptr<DeviceShell> _deviceShell,
                    shared_ptr<SubprocessUtils> _subprocessUtils,
                    shared_ptr<PortAllocator> _portAllocator,
                    const ForwarderConfig& _config);

  ~ForwardingSession();

  /**
   * @brief Creates a session and starts it.
   * @throws ForwarderException if the forwarders could not be started.
   */
  static unique_ptr<ForwardingSession> open(
      shared_ptr<DeviceShell> deviceShell,
      shared_ptr<SubprocessUtils> subprocessUtils,
      shared_ptr<PortAllocator> portAllocator, const ForwarderConfig& config,
      const vector<PortPair>& portPairs);

  /**
   * @brief Spawns the forwarders and waits for their acknowledgements.
   *
   * Only valid on a fresh session. On failure every spawned process is
   * terminated, the session ends up CLOSED with an empty mapping, and the
   * error is rethrown.
   */
  void start(const vector<PortPair>& portPairs);

  /** @brief The device port serving `hostPort`, if the session is active. */
  optional<int> lookup(int hostPort) const;

  /** @brief Terminates all forwarder processes. Never throws. */
  void close();

  SessionState getState() const { return state; }

  const PortMappingTable& getPortMapping() const { return portMapping; }

  /** @brief The host side of the control tunnel, 0 while none is held. */
  int getControlPort() const { return controlPort; }

 protected:
  void validatePortPairs(const vector<PortPair>& portPairs) const;

  /** @brief Kills a stale device forwarder still listening on `devicePort`. */
  void reclaimDevicePort(int devicePort);

  void awaitDeviceForwarder();

  void awaitHostAcknowledgements(const vector<PortPair>& portPairs,
                                 PortMappingTable* pendingMapping);

  /** @brief FAILED, then teardown, then CLOSED. */
  void fail(const ForwarderException& ex);

  void killAllProcesses();

  /** @brief Hands the control port back to the allocator. */
  void releaseControlPort();

  shared_ptr<DeviceShell> deviceShell;
  shared_ptr<PortAllocator> portAllocator;
  ForwarderConfig config;
  ProcessSupervisor supervisor;

  SessionState state;
  int controlPort;
  PortMappingTable portMapping;

  shared_ptr<ProcessHandle> controlTunnelProcess;
  shared_ptr<ProcessHandle> deviceForwarderProcess;
  shared_ptr<ProcessHandle> hostForwarderProcess;
};
}  // namespace adbfwd

#endif  // __ADBFWD_FORWARDING_SESSION__
