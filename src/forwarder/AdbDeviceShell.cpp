#include "AdbDeviceShell.hpp"

namespace adbfwd {
namespace {
bool containsAddress(const string& line, const string& address) {
  size_t pos = 0;
  while ((pos = line.find(address, pos)) != string::npos) {
    size_t end = pos + address.length();
    // 127.0.0.1:900 must not match 127.0.0.1:9000
    if (end == line.length() || !isdigit((unsigned char)line[end])) {
      return true;
    }
    pos = end;
  }
  return false;
}
}  // namespace

AdbDeviceShell::AdbDeviceShell(shared_ptr<SubprocessUtils> _subprocessUtils,
                               const string& _serial, const string& _adbPath)
    : subprocessUtils(_subprocessUtils), serial(_serial), adbPath(_adbPath) {}

string AdbDeviceShell::runAdb(const vector<string>& args) {
  vector<string> fullArgs = {"-s", serial};
  fullArgs.insert(fullArgs.end(), args.begin(), args.end());
  int exitStatus = 0;
  string output =
      subprocessUtils->subprocessToString(adbPath, fullArgs, &exitStatus);
  if (exitStatus != 0) {
    throw ForwarderException(
        ForwarderErrorKind::SPAWN_FAILURE,
        describeCommand(adbPath, fullArgs) + " exited with status " +
            to_string(exitStatus) + ": " + trim(output));
  }
  return output;
}

void AdbDeviceShell::pushFileIfNeeded(const string& localPath,
                                      const string& remotePath) {
  std::error_code ec;
  bool exists = fs::exists(localPath, ec);
  if (ec) {
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             "Cannot access " + localPath + ": " +
                                 ec.message());
  }
  if (!exists) {
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             "Missing local file: " + localPath);
  }
  string output = runAdb({"push", "--sync", localPath, remotePath});
  VLOG(1) << "push " << localPath << " -> " << remotePath << ": "
          << trim(output);
}

string AdbDeviceShell::runShellCommand(const string& command) {
  VLOG(1) << "[" << serial << "] shell: " << command;
  return runAdb({"shell", command});
}

vector<DeviceProcess> AdbDeviceShell::processesUsingDevicePort(int port) {
  return parseLsofOutput(runShellCommand("lsof"), port);
}

vector<string> AdbDeviceShell::getAttachedDevices(
    shared_ptr<SubprocessUtils> subprocessUtils, const string& adbPath) {
  int exitStatus = 0;
  string output =
      subprocessUtils->subprocessToString(adbPath, {"devices"}, &exitStatus);
  if (exitStatus != 0) {
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             "adb devices exited with status " +
                                 to_string(exitStatus) + ": " + trim(output));
  }
  return parseAdbDevicesOutput(output);
}

vector<DeviceProcess> parseLsofOutput(const string& lsofOutput, int port) {
  vector<DeviceProcess> processes;
  set<int> seenPids;
  auto lines = split(lsofOutput, '\n');
  const string loopbackAddress = "127.0.0.1:" + to_string(port);
  const string anyAddress = "*:" + to_string(port);
  // Skip the column names.
  for (size_t a = 1; a < lines.size(); a++) {
    const string& line = lines[a];
    if (!containsAddress(line, loopbackAddress) &&
        !containsAddress(line, anyAddress)) {
      continue;
    }
    auto fields = splitWhitespace(line);
    if (fields.size() < 2 || fields[1].length() > 9 ||
        fields[1].find_first_not_of("0123456789") != string::npos) {
      LOG(WARNING) << "Unexpected lsof line: " << line;
      continue;
    }
    int pid = stoi(fields[1]);
    if (!seenPids.insert(pid).second) {
      continue;
    }
    DeviceProcess process;
    process.set_pid(pid);
    process.set_name(fields[0]);
    processes.push_back(process);
  }
  return processes;
}

vector<string> parseAdbDevicesOutput(const string& output) {
  vector<string> serials;
  for (auto& line : split(output, '\n')) {
    auto fields = splitWhitespace(line);
    if (fields.size() == 2 && fields[1] == "device") {
      serials.push_back(fields[0]);
    }
  }
  return serials;
}
}  // namespace adbfwd
