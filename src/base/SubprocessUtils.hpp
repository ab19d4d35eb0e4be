#ifndef __ADBFWD_SUBPROCESS_UTILS__
#define __ADBFWD_SUBPROCESS_UTILS__

#include "ForwarderException.hpp"
#include "Headers.hpp"
#include "ProcessHandle.hpp"

namespace adbfwd {
/**
 * @brief Utility class for executing subprocesses and capturing output.
 *
 * Every process the forwarder starts goes through this class so that tests
 * can substitute canned output.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments without a shell and waits for it to
   * exit.
   * @param exitStatus If not null, receives the exit code (or 128 + signal).
   * @return Everything the command wrote to stdout and stderr.
   * @throws ForwarderException (SPAWN_FAILURE) if the command cannot be run.
   */
  virtual string subprocessToString(const string& command,
                                    const vector<string>& args,
                                    int* exitStatus);

  /**
   * @brief Starts a long running command and returns a handle to read its
   * output line by line.
   * @throws ForwarderException (SPAWN_FAILURE) if the command cannot be run.
   */
  virtual shared_ptr<ProcessHandle> spawn(const string& command,
                                          const vector<string>& args);
};

/** @brief Joins a command and its arguments for log messages. */
string describeCommand(const string& command, const vector<string>& args);
}  // namespace adbfwd

#endif  // __ADBFWD_SUBPROCESS_UTILS__
