#include "ForwarderConfig.hpp"

#include "ForwarderException.hpp"
#include "SimpleIni.h"

namespace adbfwd {
namespace {
void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (raw) {
    *value = string(raw);
  }
}

template <typename T>
void readNumber(const CSimpleIniA& ini, const char* section, const char* key,
                T* value) {
  const char* raw = ini.GetValue(section, key, NULL);
  if (!raw) {
    return;
  }
  string s = trim(raw);
  size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
  if (s.length() == start || s.length() > 18 ||
      s.find_first_not_of("0123456789", start) != string::npos) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             string("[") + section + "] " + key +
                                 " must be a number, got '" + s + "'");
  }
  *value = T(stoll(s));
}
}  // namespace

string ForwarderConfig::getHostForwarderPath() const {
  if (!hostForwarderPath.empty()) {
    return hostForwarderPath;
  }
  return outputDirectory + "/" + buildType + "/host_forwarder";
}

string ForwarderConfig::getLocalDeviceForwarderPath() const {
  if (!localDeviceForwarderPath.empty()) {
    return localDeviceForwarderPath;
  }
  return outputDirectory + "/" + buildType + "/device_forwarder";
}

string ForwarderConfig::getDeviceForwarderName() const {
  return fs::path(deviceForwarderPath).filename().string();
}

void ForwarderConfig::validate() const {
  if (handshakeTimeoutMs <= 0) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             "handshake timeout must be positive");
  }
  if (deviceSocketName.empty() ||
      deviceSocketName.find_first_of(" \t'\"") != string::npos) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             "invalid device socket name '" +
                                 deviceSocketName + "'");
  }
  if (deviceForwarderPath.empty() || getDeviceForwarderName().empty()) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             "device forwarder path must name a file");
  }
  if (bindAddress.empty()) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             "bind address must not be empty");
  }
}

void ForwarderConfig::loadFromIniFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             "Invalid config file: " + path);
  }

  readString(ini, "Paths", "adb", &adbPath);
  readString(ini, "Paths", "device_forwarder", &deviceForwarderPath);
  readString(ini, "Paths", "host_forwarder", &hostForwarderPath);
  readString(ini, "Paths", "local_device_forwarder",
             &localDeviceForwarderPath);
  readString(ini, "Paths", "output_directory", &outputDirectory);

  readString(ini, "Forwarder", "socket_name", &deviceSocketName);
  readString(ini, "Forwarder", "bind_address", &bindAddress);
  readString(ini, "Forwarder", "tool_wrapper", &toolWrapperPrefix);
  readString(ini, "Forwarder", "build_type", &buildType);

  readNumber(ini, "Timeouts", "handshake_ms", &handshakeTimeoutMs);
  readNumber(ini, "Debug", "verbose", &verboseLevel);
  LOG(INFO) << "Loaded forwarder config from " << path;
}
}  // namespace adbfwd
