#ifndef __ADBFWD_FAKE_DEVICE_SHELL__
#define __ADBFWD_FAKE_DEVICE_SHELL__

#include "DeviceShell.hpp"
#include "ForwarderException.hpp"
#include "Headers.hpp"

namespace adbfwd {
/**
 * @brief In-memory device that records every command it is asked to run.
 */
class FakeDeviceShell : public DeviceShell {
 public:
  explicit FakeDeviceShell(const string& _serial = "emulator-5554")
      : serial(_serial),
        failPush(false),
        throwOnPush(false),
        failPortQuery(false) {}

  void pushFileIfNeeded(const string& localPath,
                        const string& remotePath) override {
    if (failPush) {
      throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                               "device offline");
    }
    if (throwOnPush) {
      throw std::runtime_error("filesystem error: File name too long");
    }
    pushes.push_back(make_pair(localPath, remotePath));
  }

  string runShellCommand(const string& command) override {
    shellCommands.push_back(command);
    if (events) {
      events->push_back("shell: " + command);
    }
    return "";
  }

  vector<DeviceProcess> processesUsingDevicePort(int port) override {
    queriedPorts.push_back(port);
    if (failPortQuery) {
      throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                               "lsof: not found");
    }
    return portOwners[port];
  }

  string getSerialNumber() const override { return serial; }

  void addPortOwner(int port, int pid, const string& name) {
    DeviceProcess process;
    process.set_pid(pid);
    process.set_name(name);
    portOwners[port].push_back(process);
  }

  int countShellCommands(const string& command) const {
    return int(std::count(shellCommands.begin(), shellCommands.end(), command));
  }

  string serial;
  bool failPush;
  /** Throws a plain std::exception, like a failing filesystem call. */
  bool throwOnPush;
  bool failPortQuery;
  vector<pair<string, string>> pushes;
  vector<string> shellCommands;
  vector<int> queriedPorts;
  map<int, vector<DeviceProcess>> portOwners;
  /** When set, shared with other fakes to record the order of calls. */
  shared_ptr<vector<string>> events;
};
}  // namespace adbfwd

#endif  // __ADBFWD_FAKE_DEVICE_SHELL__
