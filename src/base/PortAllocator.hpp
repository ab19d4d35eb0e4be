#ifndef __ADBFWD_PORT_ALLOCATOR__
#define __ADBFWD_PORT_ALLOCATOR__

#include "Headers.hpp"

namespace adbfwd {
/**
 * @brief Hands out host ports for control channels.
 */
class PortAllocator {
 public:
  virtual ~PortAllocator() {}

  /** @throws ForwarderException when no port could be obtained. */
  virtual uint16_t allocateLocalPort() = 0;

  /** @brief Returns a port once the session using it is gone. */
  virtual void releaseLocalPort(uint16_t port) = 0;
};

/**
 * @brief Asks the kernel for a free loopback port by binding to port 0.
 *
 * The port is released before it is returned, so another process can still
 * grab it in between. A port handed out by this allocator is not returned
 * again until it is released.
 */
class TcpPortAllocator : public PortAllocator {
 public:
  uint16_t allocateLocalPort() override;

  void releaseLocalPort(uint16_t port) override;

 protected:
  virtual uint16_t bindEphemeralPort();

  std::mutex mutex;
  set<uint16_t> allocatedPorts;
};
}  // namespace adbfwd

#endif  // __ADBFWD_PORT_ALLOCATOR__
