#ifndef __ADBFWD_PORT_PAIR_UTILS__
#define __ADBFWD_PORT_PAIR_UTILS__

#include "Headers.hpp"

namespace adbfwd {

/**
 * @brief Parses a comma-separated list of `device:host` forwards into
 * PortPair messages. Equal length ranges (`9000-9002:8000-8002`) expand to
 * one pair per port. A device port of 0 requests a dynamic port.
 * @throws PortPairParseException when the syntax is invalid.
 */
vector<PortPair> parsePortPairs(const string& input);

/** @brief Builds the `device:host:bindAddress` specs for the host forwarder. */
vector<string> encodePortPairSpecs(const vector<PortPair>& portPairs,
                                   const string& bindAddress);

/**
 * @brief Thrown when an invalid port pair string is encountered.
 */
class PortPairParseException : public std::exception {
 public:
  explicit PortPairParseException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

}  // namespace adbfwd
#endif  // __ADBFWD_PORT_PAIR_UTILS__
