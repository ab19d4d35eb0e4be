#ifndef __ADBFWD_HEADERS__
#define __ADBFWD_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#if __APPLE__
#include <sys/ucred.h>
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#include <sys/socket.h>
#endif

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <paths.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "Forwarder.pb.h"
#include "easylogging++.h"

#if !defined(__ANDROID__)
#include "ust.hpp"
#endif

using namespace std;

// Name of the abstract unix socket the device forwarder listens on for the
// control channel.
const string DEFAULT_DEVICE_SOCKET_NAME = "chrome_device_forwarder";

// Where the device forwarder is pushed to on the device.
const string DEFAULT_DEVICE_FORWARDER_PATH = "/data/local/tmp/device_forwarder";

// Wait budget for a single handshake line.
const int DEFAULT_HANDSHAKE_TIMEOUT_MS = 30 * 1000;

#if defined(__ANDROID__)
#define STFATAL LOG(FATAL) << "No Stack Trace on Android" << endl

#define STERROR LOG(ERROR) << "No Stack Trace on Android" << endl
#else
#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()
#endif

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef ADBFWD_VERSION
#define ADBFWD_VERSION "unknown"
#endif

namespace adbfwd {
inline std::ostream &operator<<(std::ostream &os, const PortPair &pp) {
  os << pp.device_port() << ":" << pp.host_port();
  return os;
}

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

// Splits on runs of whitespace, dropping empty tokens.
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> elems;
  std::istringstream iss(s);
  std::string item;
  while (iss >> item) {
    elems.push_back(item);
  }
  return elems;
}

inline string join(const vector<string> &parts, const string &delim) {
  string retval;
  for (size_t a = 0; a < parts.size(); a++) {
    if (a) {
      retval += delim;
    }
    retval += parts[a];
  }
  return retval;
}

inline string trim(const string &s) {
  auto start = s.find_first_not_of(" \n\r\t");
  if (start == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \n\r\t");
  return s.substr(start, end - start + 1);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace adbfwd

#endif
