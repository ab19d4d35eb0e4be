#ifndef __ADBFWD_ADB_DEVICE_SHELL__
#define __ADBFWD_ADB_DEVICE_SHELL__

#include "DeviceShell.hpp"
#include "Headers.hpp"
#include "SubprocessUtils.hpp"

namespace adbfwd {
/**
 * @brief DeviceShell implemented by running the adb client.
 */
class AdbDeviceShell : public DeviceShell {
 public:
  AdbDeviceShell(shared_ptr<SubprocessUtils> _subprocessUtils,
                 const string& _serial, const string& _adbPath = "adb");

  /** @brief Uses `adb push --sync`, which skips files that are up to date. */
  void pushFileIfNeeded(const string& localPath,
                        const string& remotePath) override;

  string runShellCommand(const string& command) override;

  vector<DeviceProcess> processesUsingDevicePort(int port) override;

  string getSerialNumber() const override { return serial; }

  /**
   * @brief Returns the serials of all devices in the `device` state.
   */
  static vector<string> getAttachedDevices(
      shared_ptr<SubprocessUtils> subprocessUtils, const string& adbPath);

 protected:
  string runAdb(const vector<string>& args);

  shared_ptr<SubprocessUtils> subprocessUtils;
  string serial;
  string adbPath;
};

/**
 * @brief Extracts the owners of `port` from the output of `lsof`.
 *
 * The first line holds column names. Columns are COMMAND, PID, ... and the
 * listening address appears somewhere in the NAME column as
 * `127.0.0.1:<port>` or `*:<port>`.
 */
vector<DeviceProcess> parseLsofOutput(const string& lsofOutput, int port);

/** @brief Parses the output of `adb devices`. */
vector<string> parseAdbDevicesOutput(const string& output);
}  // namespace adbfwd

#endif  // __ADBFWD_ADB_DEVICE_SHELL__
