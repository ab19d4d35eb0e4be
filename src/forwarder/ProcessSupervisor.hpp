#ifndef __ADBFWD_PROCESS_SUPERVISOR__
#define __ADBFWD_PROCESS_SUPERVISOR__

#include "Headers.hpp"
#include "ProcessHandle.hpp"
#include "SubprocessUtils.hpp"

namespace adbfwd {
/**
 * @brief Builds the command lines of the three forwarding processes and owns
 * their teardown.
 */
class ProcessSupervisor {
 public:
  ProcessSupervisor(shared_ptr<SubprocessUtils> _subprocessUtils,
                    const string& _adbPath);

  /**
   * @brief Forwards `localControlPort` on the host to the abstract socket
   * `deviceSocketName` on the device.
   */
  shared_ptr<ProcessHandle> spawnControlTunnel(const string& serial,
                                               int localControlPort,
                                               const string& deviceSocketName);

  /**
   * @brief Starts the device forwarder through `adb shell`, optionally under
   * `toolWrapperPrefix`.
   */
  shared_ptr<ProcessHandle> spawnDeviceForwarder(
      const string& serial, const string& toolWrapperPrefix,
      const string& deviceBinaryPath, const string& deviceSocketName);

  /**
   * @brief Starts the host forwarder with the control port and the
   * space-joined `device:host:bind` specs.
   */
  shared_ptr<ProcessHandle> spawnHostForwarder(
      const string& hostBinaryPath, int localControlPort,
      const vector<string>& portPairSpecs);

  /** @brief Best effort `killall` of host forwarders left by earlier runs. */
  void killStaleHostForwarders(const string& hostBinaryPath);

  /**
   * @brief Terminates every live handle. Null and already dead handles are
   * skipped, errors are logged and swallowed.
   */
  static void killAll(const vector<shared_ptr<ProcessHandle>>& handles);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  string adbPath;
};
}  // namespace adbfwd

#endif  // __ADBFWD_PROCESS_SUPERVISOR__
