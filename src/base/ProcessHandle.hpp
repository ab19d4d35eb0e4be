#ifndef __ADBFWD_PROCESS_HANDLE__
#define __ADBFWD_PROCESS_HANDLE__

#include "Headers.hpp"

namespace adbfwd {
/** @brief Result of waiting for one line of process output. */
enum class LineStatus {
  LINE,
  STREAM_CLOSED,
  TIMED_OUT,
};

/**
 * @brief A spawned process whose merged stdout/stderr can be read line by
 * line.
 */
class ProcessHandle {
 public:
  virtual ~ProcessHandle() {}

  /**
   * @brief Blocks until a full line is available, the output ends, or
   * `timeoutMs` elapses.
   * @param line Receives the line without its terminator when LINE is
   * returned. A trailing partial line is returned as a LINE once the stream
   * has ended.
   */
  virtual LineStatus readLine(string* line, int64_t timeoutMs) = 0;

  /** @brief Returns false once the process has exited or been terminated. */
  virtual bool isAlive() = 0;

  /**
   * @brief Kills the process and releases its resources. Safe to call on an
   * already terminated handle.
   */
  virtual void terminate() = 0;

  /** @brief The command line, for logging. */
  virtual string getDescription() const = 0;
};
}  // namespace adbfwd

#endif  // __ADBFWD_PROCESS_HANDLE__
