#include "ProcessSupervisor.hpp"

namespace adbfwd {
ProcessSupervisor::ProcessSupervisor(
    shared_ptr<SubprocessUtils> _subprocessUtils, const string& _adbPath)
    : subprocessUtils(_subprocessUtils), adbPath(_adbPath) {}

shared_ptr<ProcessHandle> ProcessSupervisor::spawnControlTunnel(
    const string& serial, int localControlPort,
    const string& deviceSocketName) {
  return subprocessUtils->spawn(
      adbPath, {"-s", serial, "forward", "tcp:" + to_string(localControlPort),
                "localabstract:" + deviceSocketName});
}

shared_ptr<ProcessHandle> ProcessSupervisor::spawnDeviceForwarder(
    const string& serial, const string& toolWrapperPrefix,
    const string& deviceBinaryPath, const string& deviceSocketName) {
  string command =
      deviceBinaryPath + " -D --adb_sock=" + deviceSocketName;
  string wrapper = trim(toolWrapperPrefix);
  if (!wrapper.empty()) {
    command = wrapper + " " + command;
  }
  return subprocessUtils->spawn(adbPath, {"-s", serial, "shell", command});
}

shared_ptr<ProcessHandle> ProcessSupervisor::spawnHostForwarder(
    const string& hostBinaryPath, int localControlPort,
    const vector<string>& portPairSpecs) {
  return subprocessUtils->spawn(
      hostBinaryPath, {"--adb_port=" + to_string(localControlPort),
                       join(portPairSpecs, " ")});
}

void ProcessSupervisor::killStaleHostForwarders(const string& hostBinaryPath) {
  string name = fs::path(hostBinaryPath).filename().string();
  try {
    int exitStatus = 0;
    subprocessUtils->subprocessToString("killall", {name}, &exitStatus);
    // killall exits non-zero when nothing matched, which is the common case.
    VLOG(1) << "killall " << name << " exited with " << exitStatus;
  } catch (const ForwarderException& ex) {
    LOG(WARNING) << "Could not kill stale host forwarders: " << ex.what();
  }
}

void ProcessSupervisor::killAll(
    const vector<shared_ptr<ProcessHandle>>& handles) {
  for (auto& handle : handles) {
    if (handle.get() == NULL) {
      continue;
    }
    try {
      handle->terminate();
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Error terminating " << handle->getDescription() << ": "
                   << ex.what();
    }
  }
}
}  // namespace adbfwd
