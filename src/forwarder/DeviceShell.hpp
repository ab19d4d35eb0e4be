#ifndef __ADBFWD_DEVICE_SHELL__
#define __ADBFWD_DEVICE_SHELL__

#include "Headers.hpp"

namespace adbfwd {
/**
 * @brief Operations the forwarder needs from a connected device.
 *
 * Failures are reported with ForwarderException (SPAWN_FAILURE).
 */
class DeviceShell {
 public:
  virtual ~DeviceShell() {}

  /** @brief Copies a host file to the device unless it is already there. */
  virtual void pushFileIfNeeded(const string& localPath,
                                const string& remotePath) = 0;

  /** @brief Runs a shell command on the device and returns its output. */
  virtual string runShellCommand(const string& command) = 0;

  /** @brief Lists the processes listening on `port` on the device. */
  virtual vector<DeviceProcess> processesUsingDevicePort(int port) = 0;

  virtual string getSerialNumber() const = 0;
};
}  // namespace adbfwd

#endif  // __ADBFWD_DEVICE_SHELL__
