#include "PortMappingTable.hpp"

namespace adbfwd {
void PortMappingTable::record(int hostPort, int devicePort) {
  if (sealed) {
    STFATAL << "Tried to record " << hostPort << " -> " << devicePort
            << " into a sealed port mapping";
  }
  if (!hostToDevicePort.insert(make_pair(hostPort, devicePort)).second) {
    STFATAL << "Host port " << hostPort << " is already mapped to device port "
            << hostToDevicePort[hostPort];
  }
}

optional<int> PortMappingTable::lookup(int hostPort) const {
  auto it = hostToDevicePort.find(hostPort);
  if (it == hostToDevicePort.end()) {
    return nullopt;
  }
  return it->second;
}

void PortMappingTable::clear() {
  hostToDevicePort.clear();
  sealed = false;
}
}  // namespace adbfwd
