#include "UnixProcessHandle.hpp"

namespace adbfwd {
UnixProcessHandle::UnixProcessHandle(pid_t _pid, int _outputFd,
                                     const string& _description)
    : pid(_pid),
      outputFd(_outputFd),
      description(_description),
      eof(false),
      reaped(false) {}

UnixProcessHandle::~UnixProcessHandle() { terminate(); }

bool UnixProcessHandle::popLine(string* line) {
  auto newline = buffer.find('\n');
  if (newline == string::npos) {
    return false;
  }
  *line = buffer.substr(0, newline);
  buffer.erase(0, newline + 1);
  if (!line->empty() && line->back() == '\r') {
    line->pop_back();
  }
  return true;
}

bool UnixProcessHandle::readChunk(int64_t timeoutMs) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(outputFd, &input);
  struct timeval timeout;
  timeout.tv_sec = timeoutMs / 1000;
  timeout.tv_usec = (timeoutMs % 1000) * 1000;
  int n = select(outputFd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    if (GetErrno() == EINTR) {
      // Caller recomputes the remaining budget and retries.
      return true;
    }
    LOG(WARNING) << "select failed on output of " << description << ": "
                 << strerror(GetErrno());
    eof = true;
    return true;
  }
  if (n == 0) {
    return false;
  }

  char buf[4096];
  ssize_t readBytes = ::read(outputFd, buf, sizeof(buf));
  if (readBytes > 0) {
    buffer.append(buf, readBytes);
  } else if (readBytes == 0) {
    VLOG(1) << "Output of " << description << " ended";
    eof = true;
  } else if (GetErrno() != EINTR && GetErrno() != EAGAIN) {
    LOG(WARNING) << "Error reading output of " << description << ": "
                 << strerror(GetErrno());
    eof = true;
  }
  return true;
}

LineStatus UnixProcessHandle::readLine(string* line, int64_t timeoutMs) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (true) {
    if (popLine(line)) {
      return LineStatus::LINE;
    }
    if (eof || outputFd == -1) {
      if (!buffer.empty()) {
        *line = buffer;
        buffer.clear();
        return LineStatus::LINE;
      }
      return LineStatus::STREAM_CLOSED;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                         deadline - std::chrono::steady_clock::now())
                         .count();
    if (remaining <= 0) {
      return LineStatus::TIMED_OUT;
    }
    if (!readChunk(remaining)) {
      return LineStatus::TIMED_OUT;
    }
  }
}

bool UnixProcessHandle::isAlive() {
  if (reaped) {
    return false;
  }
  int status;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == pid || (rc == -1 && GetErrno() == ECHILD)) {
    reaped = true;
    return false;
  }
  return true;
}

void UnixProcessHandle::terminate() {
  if (outputFd != -1) {
    ::close(outputFd);
    outputFd = -1;
  }
  if (!isAlive()) {
    return;
  }

  LOG(INFO) << "Terminating pid " << pid << ": " << description;
  // Negative pid: signal the whole process group started for the child.
  if (::kill(-pid, SIGTERM) == -1 && ::kill(pid, SIGTERM) == -1) {
    LOG(WARNING) << "Could not send SIGTERM to " << pid << ": "
                 << strerror(GetErrno());
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(TERMINATE_GRACE_MS);
  while (std::chrono::steady_clock::now() < deadline) {
    if (!isAlive()) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  LOG(WARNING) << "pid " << pid << " ignored SIGTERM, sending SIGKILL";
  if (::kill(-pid, SIGKILL) == -1 && ::kill(pid, SIGKILL) == -1) {
    LOG(WARNING) << "Could not send SIGKILL to " << pid << ": "
                 << strerror(GetErrno());
  }
  while (::waitpid(pid, NULL, 0) == -1 && GetErrno() == EINTR) {
  }
  reaped = true;
}
}  // namespace adbfwd
