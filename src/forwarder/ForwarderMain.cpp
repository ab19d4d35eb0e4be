#include <cxxopts.hpp>

#include "AdbDeviceShell.hpp"
#include "ForwardingSession.hpp"
#include "LogHandler.hpp"
#include "PortPairUtils.hpp"

using namespace adbfwd;

namespace {
volatile sig_atomic_t stopRequested = 0;

void stopSignalHandler(int signum) { stopRequested = 1; }

string chooseSerial(const cxxopts::ParseResult& result,
                    shared_ptr<SubprocessUtils> subprocessUtils,
                    const string& adbPath) {
  if (result.count("serial")) {
    return result["serial"].as<string>();
  }
  auto devices = AdbDeviceShell::getAttachedDevices(subprocessUtils, adbPath);
  if (devices.empty()) {
    throw ForwarderException(ForwarderErrorKind::INVALID_ARGUMENT,
                             "No devices are attached.");
  }
  if (devices.size() > 1) {
    throw ForwarderException(
        ForwarderErrorKind::INVALID_ARGUMENT,
        "Multiple devices are attached. Please specify SERIAL with -s.");
  }
  return devices[0];
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  HandleTerminate();

  cxxopts::Options options("adbfwd",
                           "Forward device TCP ports back to this host");
  try {
    options.add_options()         //
        ("h,help", "Print help")  //
        ("version", "Print version")  //
        ("s,serial", "Serial of the device to forward from",
         cxxopts::value<string>())  //
        ("f,forward",
         "Port pairs: device:host[,device:host...], ranges as "
         "9000-9002:8000-8002, device port 0 for a dynamic port",
         cxxopts::value<string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<string>())  //
        ("bind_address", "Host address forwarded connections go to",
         cxxopts::value<string>())  //
        ("tool_wrapper", "Command prefix for the device forwarder",
         cxxopts::value<string>())  //
        ("device_forwarder", "Path of the device forwarder on the device",
         cxxopts::value<string>())  //
        ("host_forwarder", "Path of the host forwarder binary",
         cxxopts::value<string>())  //
        ("build_type", "Build directory to take forwarder binaries from",
         cxxopts::value<string>())  //
        ("timeout_ms", "Wait budget per handshake line",
         cxxopts::value<int64_t>())  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "adbfwd version " << ADBFWD_VERSION << endl;
      exit(0);
    }
    if (!result.count("forward")) {
      CLOG(INFO, "stdout") << "--forward is required\n" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    ForwarderConfig config;
    if (result.count("cfgfile")) {
      config.loadFromIniFile(result["cfgfile"].as<string>());
    }
    // Command line options win over the config file.
    if (result.count("bind_address")) {
      config.bindAddress = result["bind_address"].as<string>();
    }
    if (result.count("tool_wrapper")) {
      config.toolWrapperPrefix = result["tool_wrapper"].as<string>();
    }
    if (result.count("device_forwarder")) {
      config.deviceForwarderPath = result["device_forwarder"].as<string>();
    }
    if (result.count("host_forwarder")) {
      config.hostForwarderPath = result["host_forwarder"].as<string>();
    }
    if (result.count("build_type")) {
      config.buildType = result["build_type"].as<string>();
    }
    if (result.count("timeout_ms")) {
      config.handshakeTimeoutMs = result["timeout_ms"].as<int64_t>();
    }
    if (result.count("verbose")) {
      config.verboseLevel = result["verbose"].as<int>();
    }
    if (config.verboseLevel > 0) {
      el::Loggers::setVerboseLevel(config.verboseLevel);
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    vector<PortPair> portPairs =
        parsePortPairs(result["forward"].as<string>());

    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());
    string serial = chooseSerial(result, subprocessUtils, config.adbPath);

    string logFile = LogHandler::setupLogFiles(
        &defaultConf, GetTempDirectory() + "adbfwd", "adbfwd", serial,
        result.count("logtostdout") > 0);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("adbfwd-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    VLOG(1) << "Logging to " << logFile;

    shared_ptr<DeviceShell> deviceShell(
        new AdbDeviceShell(subprocessUtils, serial, config.adbPath));
    shared_ptr<PortAllocator> portAllocator(new TcpPortAllocator());

    ::signal(SIGINT, stopSignalHandler);
    ::signal(SIGTERM, stopSignalHandler);

    auto session = ForwardingSession::open(deviceShell, subprocessUtils,
                                           portAllocator, config, portPairs);
    for (auto& it : session->getPortMapping().getEntries()) {
      CLOG(INFO, "stdout") << "device port " << it.second << " -> host port "
                           << it.first << endl;
    }
    CLOG(INFO, "stdout") << "Forwarding, press ctrl+c to stop." << endl;
    while (!stopRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LOG(INFO) << "Got stop signal";
    session->close();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const PortPairParseException& ppe) {
    CLOG(INFO, "stdout") << "Invalid --forward: " << ppe.what() << endl;
    exit(1);
  } catch (const ForwarderException& fe) {
    CLOG(INFO, "stdout") << fe.what() << endl;
    exit(1);
  }

  google::protobuf::ShutdownProtobufLibrary();
  return 0;
}
