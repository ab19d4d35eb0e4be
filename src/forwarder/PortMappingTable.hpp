#ifndef __ADBFWD_PORT_MAPPING_TABLE__
#define __ADBFWD_PORT_MAPPING_TABLE__

#include "Headers.hpp"

namespace adbfwd {
/**
 * @brief Maps each forwarded host port to the device port it serves.
 *
 * Filled while acknowledgements arrive and sealed once the session is
 * active. Recording a host port twice, or recording into a sealed table, is
 * a programming error.
 */
class PortMappingTable {
 public:
  PortMappingTable() : sealed(false) {}

  void record(int hostPort, int devicePort);

  optional<int> lookup(int hostPort) const;

  void seal() { sealed = true; }

  bool isSealed() const { return sealed; }

  size_t size() const { return hostToDevicePort.size(); }

  bool empty() const { return hostToDevicePort.empty(); }

  /** @brief Drops every entry and unseals the table. */
  void clear();

  /** @brief Entries ordered by host port. */
  const map<int, int>& getEntries() const { return hostToDevicePort; }

 protected:
  map<int, int> hostToDevicePort;
  bool sealed;
};
}  // namespace adbfwd

#endif  // __ADBFWD_PORT_MAPPING_TABLE__
