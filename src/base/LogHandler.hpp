#ifndef __ADBFWD_LOG_HANDLER__
#define __ADBFWD_LOG_HANDLER__

#include "Headers.hpp"

namespace adbfwd {
/**
 * @brief Configures easylogging++ for the forwarder tools and tests.
 *
 * One forwarder process runs per device, so log files carry the device
 * serial as well as the pid.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param deviceSerial Serial of the device the process forwards for, may be
   * empty.
   * @return The full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              const string &deviceSerial,
                              bool logToStdout = false,
                              const string &maxlogsize = "20971520");

  /**
   * @brief `<prefix>[-<serial>]-<local time>_<pid>.log`. Characters of the
   * serial that do not belong in a file name (network serials contain ':')
   * become '_'.
   */
  static string makeLogFilename(const string &filenamePrefix,
                                const string &deviceSerial, time_t when,
                                pid_t pid);

  /** @brief Removes a rolled-out log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace adbfwd
#endif  // __ADBFWD_LOG_HANDLER__
