#include "PortAllocator.hpp"

#include "ForwarderException.hpp"

namespace adbfwd {
uint16_t TcpPortAllocator::bindEphemeralPort() {
  int sockFd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (sockFd == -1) {
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             string("socket: ") + strerror(GetErrno()));
  }
  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  if (::bind(sockFd, (sockaddr*)&addr, sizeof(addr)) == -1) {
    int localErrno = GetErrno();
    ::close(sockFd);
    throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                             string("bind: ") + strerror(localErrno));
  }
  socklen_t len = sizeof(addr);
  FATAL_FAIL(::getsockname(sockFd, (sockaddr*)&addr, &len));
  ::close(sockFd);
  return ntohs(addr.sin_port);
}

uint16_t TcpPortAllocator::allocateLocalPort() {
  lock_guard<std::mutex> guard(mutex);
  for (int attempt = 0; attempt < 100; attempt++) {
    uint16_t port = bindEphemeralPort();
    if (allocatedPorts.insert(port).second) {
      VLOG(1) << "Allocated control port " << port;
      return port;
    }
  }
  throw ForwarderException(ForwarderErrorKind::SPAWN_FAILURE,
                           "Could not find an unused local port");
}

void TcpPortAllocator::releaseLocalPort(uint16_t port) {
  lock_guard<std::mutex> guard(mutex);
  if (allocatedPorts.erase(port)) {
    VLOG(1) << "Released control port " << port;
  } else {
    LOG(WARNING) << "Released port " << port << " was never allocated";
  }
}
}  // namespace adbfwd
