#include "FakeDeviceShell.hpp"
#include "FakeSubprocessUtils.hpp"
#include "ForwardingSession.hpp"
#include "LogCapture.hpp"
#include "PortPairUtils.hpp"
#include "TestHeaders.hpp"

using namespace adbfwd;
using Catch::Matchers::ContainsSubstring;

namespace {
class FixedPortAllocator : public PortAllocator {
 public:
  explicit FixedPortAllocator(uint16_t _port) : port(_port), calls(0) {}

  uint16_t allocateLocalPort() override {
    calls++;
    return port;
  }

  void releaseLocalPort(uint16_t released) override {
    releases.push_back(released);
  }

  uint16_t port;
  int calls;
  vector<uint16_t> releases;
};

PortPair makePair(int devicePort, int hostPort) {
  PortPair pp;
  pp.set_device_port(devicePort);
  pp.set_host_port(hostPort);
  return pp;
}

struct SessionFixture {
  SessionFixture()
      : deviceShell(new FakeDeviceShell()),
        subprocessUtils(new FakeSubprocessUtils()),
        portAllocator(new FixedPortAllocator(5037)) {
    config.handshakeTimeoutMs = 50;
    config.hostForwarderPath = "/out/Release/host_forwarder";
    config.localDeviceForwarderPath = "/out/Release/device_forwarder";
  }

  unique_ptr<ForwardingSession> makeSession() {
    return unique_ptr<ForwardingSession>(new ForwardingSession(
        deviceShell, subprocessUtils, portAllocator, config));
  }

  // Runs start() and returns the kind of the error it threw.
  ForwarderErrorKind startAndCatch(ForwardingSession* session,
                                   const vector<PortPair>& portPairs,
                                   string* message = NULL) {
    try {
      session->start(portPairs);
    } catch (const ForwarderException& ex) {
      if (message) {
        *message = ex.what();
      }
      return ex.getKind();
    }
    FAIL("Expected start() to throw");
    return ForwarderErrorKind::INVALID_ARGUMENT;
  }

  shared_ptr<FakeDeviceShell> deviceShell;
  shared_ptr<FakeSubprocessUtils> subprocessUtils;
  shared_ptr<FixedPortAllocator> portAllocator;
  ForwarderConfig config;
};

const string DEVICE_STARTED = "Starting Device Forwarder.";
}  // namespace

TEST_CASE("Session maps dynamic and fixed device ports", "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine("starting up")->addLine(
      DEVICE_STARTED);
  f.subprocessUtils->hostHandle
      ->addLine("Forwarding device port 9001 to host 8080:")
      ->addLine("Forwarding device port 9000 to host 8081:");

  auto session = ForwardingSession::open(
      f.deviceShell, f.subprocessUtils, f.portAllocator, f.config,
      {makePair(0, 8080), makePair(9000, 8081)});

  REQUIRE(session->getState() == SessionState::ACTIVE);
  REQUIRE(session->getControlPort() == 5037);
  REQUIRE(session->getPortMapping().size() == 2);
  REQUIRE(session->getPortMapping().isSealed());
  REQUIRE(session->lookup(8080) == optional<int>(9001));
  REQUIRE(session->lookup(8081) == optional<int>(9000));
  REQUIRE_FALSE(session->lookup(8082).has_value());

  SECTION("Processes are started with the expected command lines") {
    auto tunnel = f.subprocessUtils->findSpawn("forward");
    REQUIRE(tunnel != NULL);
    REQUIRE(tunnel->args ==
            vector<string>({"-s", "emulator-5554", "forward", "tcp:5037",
                            "localabstract:chrome_device_forwarder"}));

    auto device = f.subprocessUtils->findSpawn("shell");
    REQUIRE(device != NULL);
    REQUIRE(device->args.back() ==
            "/data/local/tmp/device_forwarder -D "
            "--adb_sock=chrome_device_forwarder");

    auto host = f.subprocessUtils->findSpawn("/out/Release/host_forwarder");
    REQUIRE(host != NULL);
    REQUIRE(host->args ==
            vector<string>({"--adb_port=5037",
                            "0:8080:127.0.0.1 9000:8081:127.0.0.1"}));
  }

  SECTION("The device forwarder binary is pushed before spawning") {
    REQUIRE(f.deviceShell->pushes.size() == 1);
    REQUIRE(f.deviceShell->pushes[0].first == "/out/Release/device_forwarder");
    REQUIRE(f.deviceShell->pushes[0].second ==
            "/data/local/tmp/device_forwarder");
  }

  SECTION("Stale host forwarders are killed by name") {
    REQUIRE(f.subprocessUtils->runCalls.size() == 1);
    REQUIRE(f.subprocessUtils->runCalls[0].command == "killall");
    REQUIRE(f.subprocessUtils->runCalls[0].args ==
            vector<string>({"host_forwarder"}));
  }

  SECTION("close() terminates everything once and is idempotent") {
    session->close();
    REQUIRE(session->getState() == SessionState::CLOSED);
    REQUIRE(session->getControlPort() == 0);
    REQUIRE(f.portAllocator->releases == vector<uint16_t>({5037}));
    REQUIRE(session->getPortMapping().empty());
    REQUIRE_FALSE(session->lookup(8080).has_value());
    REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
    REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);
    REQUIRE(f.subprocessUtils->hostHandle->getTerminateCount() == 1);

    REQUIRE_NOTHROW(session->close());
    REQUIRE(session->getState() == SessionState::CLOSED);
    REQUIRE(f.portAllocator->releases.size() == 1);
    REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
    REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);
    REQUIRE(f.subprocessUtils->hostHandle->getTerminateCount() == 1);
  }

  SECTION("A second start() is rejected and leaves the session running") {
    string message;
    REQUIRE(f.startAndCatch(session.get(), {makePair(0, 9090)}, &message) ==
            ForwarderErrorKind::SESSION_ALREADY_STARTED);
    REQUIRE(session->getState() == SessionState::ACTIVE);
    REQUIRE(session->lookup(8080) == optional<int>(9001));
    REQUIRE(f.subprocessUtils->spawnCalls.size() == 3);
    REQUIRE(f.subprocessUtils->hostHandle->getTerminateCount() == 0);
  }
}

TEST_CASE("Device forwarder error line aborts before the host forwarder",
          "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine(
      "[0101/000000:ERROR:device_forwarder_main.cc(42)] Could not bind to "
      "socket");
  auto session = f.makeSession();

  string message;
  REQUIRE(f.startAndCatch(session.get(), {makePair(9000, 8080)}, &message) ==
          ForwarderErrorKind::HANDSHAKE_FAILURE);
  REQUIRE_THAT(message, ContainsSubstring("Could not bind to socket"));
  REQUIRE(f.subprocessUtils->hostSpawnCount == 0);
  REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
  REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);
  REQUIRE(session->getState() == SessionState::CLOSED);
  REQUIRE(session->getPortMapping().empty());
}

TEST_CASE("Device forwarder output ending early is an unexpected stream end",
          "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine("/system/bin/sh: device_forwarder: "
                                           "not found");
  auto session = f.makeSession();

  REQUIRE(f.startAndCatch(session.get(), {makePair(0, 8080)}) ==
          ForwarderErrorKind::UNEXPECTED_STREAM_END);
  REQUIRE(f.subprocessUtils->hostSpawnCount == 0);
  REQUIRE_FALSE(f.subprocessUtils->tunnelHandle->isAlive());
  REQUIRE_FALSE(f.subprocessUtils->deviceHandle->isAlive());
  REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
  REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);

  // The failure path already tore everything down.
  session->close();
  REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
  REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);
}

TEST_CASE("Silent device forwarder times out", "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->hangAtEnd();
  auto session = f.makeSession();

  REQUIRE(f.startAndCatch(session.get(), {makePair(0, 8080)}) ==
          ForwarderErrorKind::HANDSHAKE_TIMEOUT);
  REQUIRE(f.subprocessUtils->hostSpawnCount == 0);
  REQUIRE(session->getState() == SessionState::CLOSED);
}

TEST_CASE("Host forwarder failures discard partial mappings",
          "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine(DEVICE_STARTED);
  auto host = f.subprocessUtils->hostHandle;
  host->addLine("Forwarding device port 9000 to host 8080:");
  vector<PortPair> portPairs = {makePair(9000, 8080), makePair(9001, 8081),
                                makePair(9002, 8082)};
  auto session = f.makeSession();

  SECTION("Explicit failure line") {
    host->addLine("Couldn't start forwarder server for port spec: 9001:8081");
    string message;
    REQUIRE(f.startAndCatch(session.get(), portPairs, &message) ==
            ForwarderErrorKind::HANDSHAKE_FAILURE);
    REQUIRE_THAT(message, ContainsSubstring("Failed to forward port 9001 to "
                                            "8081"));
    REQUIRE_THAT(message, !ContainsSubstring("while waiting for"));
  }

  SECTION("Output ends") {
    host->addLine("Forwarding device port 9001 to host 8081:");
    REQUIRE(f.startAndCatch(session.get(), portPairs) ==
            ForwarderErrorKind::UNEXPECTED_STREAM_END);
  }

  SECTION("Output stalls") {
    host->addLine("Forwarding device port 9001 to host 8081:")->hangAtEnd();
    REQUIRE(f.startAndCatch(session.get(), portPairs) ==
            ForwarderErrorKind::HANDSHAKE_TIMEOUT);
  }

  SECTION("Acknowledgement for a port that was never requested") {
    host->addLine("Forwarding device port 9005 to host 8085:");
    REQUIRE(f.startAndCatch(session.get(), portPairs) ==
            ForwarderErrorKind::HANDSHAKE_FAILURE);
  }

  SECTION("Failure line for a different pair") {
    host->addLine("Couldn't start forwarder server for port spec: 9002:8082");
    string message;
    REQUIRE(f.startAndCatch(session.get(), portPairs, &message) ==
            ForwarderErrorKind::HANDSHAKE_FAILURE);
    REQUIRE_THAT(message, ContainsSubstring("Failed to forward port 9002 to "
                                            "8082 while waiting for "
                                            "9001:8081"));
  }

  SECTION("Acknowledgements out of request order") {
    host->addLine("Forwarding device port 9002 to host 8082:")
        ->addLine("Forwarding device port 9001 to host 8081:");
    REQUIRE(f.startAndCatch(session.get(), portPairs) ==
            ForwarderErrorKind::HANDSHAKE_FAILURE);
  }

  SECTION("Fixed device port reported differently") {
    host->addLine("Forwarding device port 9999 to host 8081:");
    REQUIRE(f.startAndCatch(session.get(), portPairs) ==
            ForwarderErrorKind::HANDSHAKE_FAILURE);
  }

  REQUIRE(session->getState() == SessionState::CLOSED);
  REQUIRE(session->getPortMapping().empty());
  REQUIRE_FALSE(session->lookup(8080).has_value());
  REQUIRE(session->getControlPort() == 0);
  REQUIRE(f.portAllocator->releases == vector<uint16_t>({5037}));
  REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
  REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);
  REQUIRE(host->getTerminateCount() == 1);
}

TEST_CASE("Host forwarder noise between acknowledgements is skipped",
          "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine(DEVICE_STARTED);
  f.subprocessUtils->hostHandle
      ->addLine("[0101/000000:INFO:host_forwarder_main.cc(115)] Starting host "
                "process daemon (pid=77)")
      ->addLine("Forwarding device port 9000 to host 8080:")
      ->addLine("")
      ->addLine("Forwarding device port 43210 to host 8081:");

  auto session = ForwardingSession::open(
      f.deviceShell, f.subprocessUtils, f.portAllocator, f.config,
      {makePair(9000, 8080), makePair(0, 8081)});
  REQUIRE(session->lookup(8080) == optional<int>(9000));
  REQUIRE(session->lookup(8081) == optional<int>(43210));
}

TEST_CASE("Stale device forwarders are reclaimed", "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine(DEVICE_STARTED);
  f.subprocessUtils->hostHandle->addLine(
      "Forwarding device port 9000 to host 8080:");
  auto events = make_shared<vector<string>>();
  f.deviceShell->events = events;
  f.subprocessUtils->events = events;

  SECTION("A previous device forwarder is killed before anything spawns") {
    f.deviceShell->addPortOwner(9000, 4242, "device_forwarder");
    auto session =
        ForwardingSession::open(f.deviceShell, f.subprocessUtils,
                                f.portAllocator, f.config, {makePair(9000, 8080)});
    REQUIRE(f.deviceShell->countShellCommands("kill 4242") == 1);
    REQUIRE(f.deviceShell->shellCommands.size() == 1);
    REQUIRE(session->getState() == SessionState::ACTIVE);

    REQUIRE(events->size() == 4);
    REQUIRE(events->at(0) == "shell: kill 4242");
    for (size_t a = 1; a < events->size(); a++) {
      INFO("Checking event " << a);
      REQUIRE(events->at(a).find("spawn: ") == 0);
    }
  }

  SECTION("Other processes on the port are left alone and reported") {
    LogCapture logCapture;
    f.deviceShell->addPortOwner(9000, 1717, "com.android.chrome");
    auto session =
        ForwardingSession::open(f.deviceShell, f.subprocessUtils,
                                f.portAllocator, f.config, {makePair(9000, 8080)});
    REQUIRE(f.deviceShell->shellCommands.empty());
    REQUIRE(session->getState() == SessionState::ACTIVE);
    REQUIRE(logCapture.count(el::Level::Error,
                             {"PortConflictWarning", "1717",
                              "com.android.chrome", "9000"}) == 1);
  }

  SECTION("A failing port query does not stop the session") {
    LogCapture logCapture;
    f.deviceShell->failPortQuery = true;
    auto session =
        ForwardingSession::open(f.deviceShell, f.subprocessUtils,
                                f.portAllocator, f.config, {makePair(9000, 8080)});
    REQUIRE(f.deviceShell->shellCommands.empty());
    REQUIRE(session->getState() == SessionState::ACTIVE);
    REQUIRE(logCapture.count(el::Level::Warning,
                             {"PortConflictWarning", "9000"}) == 1);
  }
}

TEST_CASE("Dynamic device ports are never reclaimed", "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine(DEVICE_STARTED);
  f.subprocessUtils->hostHandle->addLine(
      "Forwarding device port 38000 to host 8080:");
  f.deviceShell->addPortOwner(0, 4242, "device_forwarder");

  auto session = ForwardingSession::open(f.deviceShell, f.subprocessUtils,
                                         f.portAllocator, f.config,
                                         {makePair(0, 8080)});
  REQUIRE(f.deviceShell->queriedPorts.empty());
  REQUIRE(f.deviceShell->shellCommands.empty());
}

TEST_CASE("Spawn failures abort startup", "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine(DEVICE_STARTED);
  auto session = f.makeSession();

  SECTION("Push of the device binary fails") {
    f.deviceShell->failPush = true;
    REQUIRE(f.startAndCatch(session.get(), {makePair(0, 8080)}) ==
            ForwarderErrorKind::SPAWN_FAILURE);
    REQUIRE(f.subprocessUtils->spawnCalls.empty());
  }

  SECTION("Device shell fails with a plain std::exception") {
    f.deviceShell->throwOnPush = true;
    string message;
    REQUIRE(f.startAndCatch(session.get(), {makePair(0, 8080)}, &message) ==
            ForwarderErrorKind::SPAWN_FAILURE);
    REQUIRE_THAT(message, ContainsSubstring("File name too long"));
    REQUIRE(f.subprocessUtils->spawnCalls.empty());
    REQUIRE(f.portAllocator->releases == vector<uint16_t>({5037}));
  }

  SECTION("Host forwarder cannot be executed") {
    f.subprocessUtils->failSpawnOf("host");
    REQUIRE(f.startAndCatch(session.get(), {makePair(0, 8080)}) ==
            ForwarderErrorKind::SPAWN_FAILURE);
    REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
    REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);
  }

  REQUIRE(session->getState() == SessionState::CLOSED);
}

TEST_CASE("Invalid requests are rejected before anything runs",
          "[ForwardingSession]") {
  SessionFixture f;
  auto session = f.makeSession();

  SECTION("No pairs") {
    REQUIRE(f.startAndCatch(session.get(), {}) ==
            ForwarderErrorKind::INVALID_ARGUMENT);
  }

  SECTION("Duplicate host port") {
    REQUIRE(f.startAndCatch(session.get(),
                            {makePair(0, 8080), makePair(9000, 8080)}) ==
            ForwarderErrorKind::INVALID_ARGUMENT);
  }

  SECTION("Host port 0") {
    REQUIRE(f.startAndCatch(session.get(), {makePair(9000, 0)}) ==
            ForwarderErrorKind::INVALID_ARGUMENT);
  }

  REQUIRE(f.subprocessUtils->spawnCalls.empty());
  REQUIRE(f.portAllocator->calls == 0);
  REQUIRE(session->getState() == SessionState::INITIALIZING);
}

TEST_CASE("Tool wrapper prefixes the device forwarder command",
          "[ForwardingSession]") {
  SessionFixture f;
  f.config.toolWrapperPrefix = "asanwrapper ";
  f.subprocessUtils->deviceHandle->addLine(DEVICE_STARTED);
  f.subprocessUtils->hostHandle->addLine(
      "Forwarding device port 9000 to host 8080:");

  auto session = ForwardingSession::open(f.deviceShell, f.subprocessUtils,
                                         f.portAllocator, f.config,
                                         {makePair(9000, 8080)});
  auto device = f.subprocessUtils->findSpawn("shell");
  REQUIRE(device != NULL);
  REQUIRE(device->args.back() ==
          "asanwrapper /data/local/tmp/device_forwarder -D "
          "--adb_sock=chrome_device_forwarder");
}

TEST_CASE("Destroying an active session terminates its processes",
          "[ForwardingSession]") {
  SessionFixture f;
  f.subprocessUtils->deviceHandle->addLine(DEVICE_STARTED);
  f.subprocessUtils->hostHandle->addLine(
      "Forwarding device port 9000 to host 8080:");
  {
    auto session = ForwardingSession::open(f.deviceShell, f.subprocessUtils,
                                           f.portAllocator, f.config,
                                           {makePair(9000, 8080)});
    REQUIRE(session->getState() == SessionState::ACTIVE);
  }
  REQUIRE(f.subprocessUtils->tunnelHandle->getTerminateCount() == 1);
  REQUIRE(f.subprocessUtils->deviceHandle->getTerminateCount() == 1);
  REQUIRE(f.subprocessUtils->hostHandle->getTerminateCount() == 1);
}

TEST_CASE("A closed session cannot be restarted", "[ForwardingSession]") {
  SessionFixture f;
  auto session = f.makeSession();
  session->close();
  REQUIRE(session->getState() == SessionState::CLOSED);
  REQUIRE(f.startAndCatch(session.get(), {makePair(0, 8080)}) ==
          ForwarderErrorKind::SESSION_ALREADY_STARTED);
}
