#include "PortPairUtils.hpp"

namespace adbfwd {
namespace {
int parsePort(const string& s, bool allowZero) {
  if (s.empty() || s.find_first_not_of("0123456789") != string::npos) {
    throw std::invalid_argument("'" + s + "' is not a port number");
  }
  int port = stoi(s);
  if (port > 65535) {
    throw std::out_of_range("port " + s + " is larger than 65535");
  }
  if (port == 0 && !allowZero) {
    throw std::invalid_argument("host port must not be 0");
  }
  return port;
}

PortPair makePortPair(int devicePort, int hostPort) {
  PortPair pp;
  pp.set_device_port(devicePort);
  pp.set_host_port(hostPort);
  return pp;
}

void processPortPairArg(vector<PortPair>& portPairs, const string& element,
                        const string& input) {
  vector<string> deviceHost = split(element, ':');
  if (deviceHost.size() != 2) {
    throw PortPairParseException(
        "Port pair must have a device and a host port between a ':' (got '" +
        element + "')");
  }
  try {
    bool deviceIsRange = deviceHost[0].find('-') != string::npos;
    bool hostIsRange = deviceHost[1].find('-') != string::npos;
    if (deviceIsRange && hostIsRange) {
      vector<string> deviceRange = split(deviceHost[0], '-');
      vector<string> hostRange = split(deviceHost[1], '-');
      if (deviceRange.size() != 2 || hostRange.size() != 2) {
        throw PortPairParseException("Invalid port range in '" + element +
                                     "'");
      }
      int deviceStart = parsePort(deviceRange[0], false);
      int deviceEnd = parsePort(deviceRange[1], false);
      int hostStart = parsePort(hostRange[0], false);
      int hostEnd = parsePort(hostRange[1], false);
      if (deviceEnd < deviceStart || hostEnd < hostStart) {
        throw PortPairParseException("Port ranges must be ascending in '" +
                                     element + "'");
      }
      if (deviceEnd - deviceStart != hostEnd - hostStart) {
        throw PortPairParseException(
            "device/host port range must have same length");
      }
      for (int i = 0; i <= deviceEnd - deviceStart; ++i) {
        portPairs.push_back(makePortPair(deviceStart + i, hostStart + i));
      }
    } else if (deviceIsRange || hostIsRange) {
      throw PortPairParseException(
          "Invalid port range syntax: if device is a range, "
          "host must be a range (and vice versa)");
    } else {
      portPairs.push_back(makePortPair(parsePort(deviceHost[0], true),
                                       parsePort(deviceHost[1], false)));
    }
  } catch (const PortPairParseException& e) {
    throw;
  } catch (const std::logic_error& lr) {
    throw PortPairParseException("Invalid port pair argument '" + input +
                                 "': " + lr.what());
  }
}
}  // namespace

vector<PortPair> parsePortPairs(const string& input) {
  vector<PortPair> portPairs;
  for (auto& element : split(input, ',')) {
    string trimmed = trim(element);
    if (trimmed.empty()) {
      continue;
    }
    processPortPairArg(portPairs, trimmed, input);
  }
  if (portPairs.empty()) {
    throw PortPairParseException("No port pairs in '" + input + "'");
  }
  return portPairs;
}

vector<string> encodePortPairSpecs(const vector<PortPair>& portPairs,
                                   const string& bindAddress) {
  vector<string> specs;
  for (auto& pp : portPairs) {
    specs.push_back(to_string(pp.device_port()) + ":" +
                    to_string(pp.host_port()) + ":" + bindAddress);
  }
  return specs;
}

}  // namespace adbfwd
