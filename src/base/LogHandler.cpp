#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace adbfwd {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity is driven by cxxopts, easylogging's own argument parsing only
  // picks up --v / --vmodule.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::makeLogFilename(const string &filenamePrefix,
                                   const string &deviceSerial, time_t when,
                                   pid_t pid) {
  char buffer[80];
  struct tm timeinfo;
  localtime_r(&when, &timeinfo);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);

  string filename = filenamePrefix;
  if (!deviceSerial.empty()) {
    string serial = deviceSerial;
    for (auto &c : serial) {
      if (!isalnum((unsigned char)c) && c != '-' && c != '_' && c != '.') {
        c = '_';
      }
    }
    filename += "-" + serial;
  }
  return filename + "-" + buffer + "_" + to_string(pid) + ".log";
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &path,
                                 const string &filenamePrefix,
                                 const string &deviceSerial, bool logToStdout,
                                 const string &maxlogsize) {
  string fullFname = createLogFile(
      path, makeLogFilename(filenamePrefix, deviceSerial, time(NULL), getpid()));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
  return fullFname;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  string fullFname = path + "/" + filename;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create logfile directory " << path << ": "
                          << ec.message() << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}
}  // namespace adbfwd
