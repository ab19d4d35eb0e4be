#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace adbfwd;

int main(int argc, char **argv) {
  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0 ||
        strncmp(argv[i], "--list", 6) == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      adbfwd::LogHandler::setupLogHandler(&argc, &argv);
  adbfwd::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  adbfwd::HandleTerminate();

  string logDirectoryPattern =
      GetTempDirectory() + string("adbfwd_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  adbfwd::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", "",
                                    false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  std::error_code ec;
  fs::remove_all(logDirectory, ec);
  google::protobuf::ShutdownProtobufLibrary();
  return result;
}
