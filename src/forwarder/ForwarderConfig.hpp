#ifndef __ADBFWD_FORWARDER_CONFIG__
#define __ADBFWD_FORWARDER_CONFIG__

#include "Headers.hpp"

namespace adbfwd {
/**
 * @brief Paths, names and timeouts used by a forwarding session.
 *
 * Empty forwarder paths fall back to `<outputDirectory>/<buildType>/...`.
 */
struct ForwarderConfig {
  /** @brief adb client used for every device interaction. */
  string adbPath = "adb";
  /** @brief Where the device forwarder lives on the device. */
  string deviceForwarderPath = DEFAULT_DEVICE_FORWARDER_PATH;
  /** @brief Abstract socket the control channel is tunneled to. */
  string deviceSocketName = DEFAULT_DEVICE_SOCKET_NAME;
  /** @brief Address the host forwarder connects forwarded traffic to. */
  string bindAddress = "127.0.0.1";
  /** @brief Prefix for the device forwarder command, e.g. a memory checker. */
  string toolWrapperPrefix;
  string outputDirectory = "out";
  string buildType = "Release";
  /** @brief Overrides for the built forwarder binaries on the host. */
  string hostForwarderPath;
  string localDeviceForwarderPath;
  /** @brief Wait budget for each expected handshake line. */
  int64_t handshakeTimeoutMs = DEFAULT_HANDSHAKE_TIMEOUT_MS;
  /** @brief Verbose logging level, -1 leaves the current level alone. */
  int verboseLevel = -1;

  string getHostForwarderPath() const;

  string getLocalDeviceForwarderPath() const;

  /** @brief Process name the device forwarder shows up with on the device. */
  string getDeviceForwarderName() const;

  /** @brief Throws ForwarderException (INVALID_ARGUMENT) on bad values. */
  void validate() const;

  /**
   * @brief Overrides fields with the values found in an INI file.
   *
   * Keys: [Paths] adb, device_forwarder, host_forwarder,
   * local_device_forwarder, output_directory; [Forwarder] socket_name,
   * bind_address, tool_wrapper, build_type; [Timeouts] handshake_ms;
   * [Debug] verbose.
   * @throws ForwarderException (INVALID_ARGUMENT) if the file cannot be read
   * or holds a bad value.
   */
  void loadFromIniFile(const string& path);
};
}  // namespace adbfwd

#endif  // __ADBFWD_FORWARDER_CONFIG__
