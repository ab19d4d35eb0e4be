#ifndef __ADBFWD_UNIX_PROCESS_HANDLE__
#define __ADBFWD_UNIX_PROCESS_HANDLE__

#include "Headers.hpp"
#include "ProcessHandle.hpp"

namespace adbfwd {
/**
 * @brief ProcessHandle backed by a forked child and the read end of the pipe
 * that carries its stdout and stderr.
 *
 * The child runs in its own process group so that terminate() also reaches
 * anything it started (for example a tool wrapper).
 */
class UnixProcessHandle : public ProcessHandle {
 public:
  UnixProcessHandle(pid_t _pid, int _outputFd, const string& _description);

  ~UnixProcessHandle() override;

  LineStatus readLine(string* line, int64_t timeoutMs) override;

  bool isAlive() override;

  void terminate() override;

  string getDescription() const override { return description; }

  pid_t getPid() const { return pid; }

 protected:
  /** @brief Waits for and reads one chunk of output. False on timeout. */
  bool readChunk(int64_t timeoutMs);

  bool popLine(string* line);

  pid_t pid;
  int outputFd;
  string description;
  string buffer;
  bool eof;
  bool reaped;

  /** @brief How long a child gets to exit after SIGTERM before SIGKILL. */
  static constexpr int TERMINATE_GRACE_MS = 1000;
};
}  // namespace adbfwd

#endif  // __ADBFWD_UNIX_PROCESS_HANDLE__
