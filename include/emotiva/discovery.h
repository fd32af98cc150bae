#pragma once

#include "emotiva/diagnostics.h"
#include "emotiva/types.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace emotiva {

/**
 * Discovery tuning, normally taken from Config.
 */
struct DiscoveryOptions {
  /// Device port the ping is sent to.
  uint16_t port = kDiscoveryPort;
  /// Local port the transponder reply arrives on (0 = ephemeral).
  uint16_t response_port = 0;
  int attempts = 3;
  /// Delay before the second attempt; doubled for each further attempt.
  std::chrono::milliseconds backoff{250};
  /// Version offered in the ping.
  ProtocolVersion max_version{3, 1};
  std::string bind_address = "0.0.0.0";

  static DiscoveryOptions FromConfig(const Config& config);
};

/**
 * Ping/transponder exchange that finds a device's ports and protocol version.
 */
class Discovery {
 public:
  Discovery(DiscoveryOptions options, Diagnostics& diagnostics);

  /**
   * Ping `host` and wait for its transponder.
   *
   * Socket, send and timeout failures are retried with backoff. A reply that
   * arrives but cannot be interpreted is reported at once.
   *
   * @throws DiscoveryError when the device does not answer or answers badly.
   */
  Transponder FetchTransponder(const std::string& host, std::chrono::milliseconds timeout);

 private:
  Transponder Attempt(const std::string& host, std::chrono::milliseconds timeout);

  DiscoveryOptions options_;
  Diagnostics& diagnostics_;
};

}  // namespace emotiva
