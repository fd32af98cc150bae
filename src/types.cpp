#include "emotiva/types.h"

#include <sstream>
#include <tuple>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace emotiva {

const char* PortRoleName(PortRole role) {
  switch (role) {
    case PortRole::kControl:
      return "controlPort";
    case PortRole::kNotify:
      return "notifyPort";
    case PortRole::kInfo:
      return "infoPort";
    case PortRole::kMenuNotify:
      return "menuNotifyPort";
    case PortRole::kSetup:
      return "setupPortTCP";
  }
  return "unknownPort";
}

const char* ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kDisconnecting:
      return "disconnecting";
  }
  return "unknown";
}

ProtocolVersion ProtocolVersion::Parse(const std::string& text) {
  ProtocolVersion version;
  std::istringstream in(text);
  int major = 0;
  int minor = 0;
  char dot = 0;
  if (!(in >> major >> dot >> minor) || dot != '.' || major < 0 || minor < 0) {
    return version;
  }
  in >> std::ws;
  if (!in.eof()) {
    return version;
  }
  version.major = major;
  version.minor = minor;
  return version;
}

ProtocolVersion ProtocolVersion::Negotiate(const ProtocolVersion& configured_max,
                                           const ProtocolVersion& device_reported) {
  return device_reported < configured_max ? device_reported : configured_max;
}

std::string ProtocolVersion::ToString() const {
  return std::to_string(major) + "." + std::to_string(minor);
}

bool operator==(const ProtocolVersion& a, const ProtocolVersion& b) {
  return a.major == b.major && a.minor == b.minor;
}

bool operator!=(const ProtocolVersion& a, const ProtocolVersion& b) { return !(a == b); }

bool operator<(const ProtocolVersion& a, const ProtocolVersion& b) {
  return std::tie(a.major, a.minor) < std::tie(b.major, b.minor);
}

bool operator<=(const ProtocolVersion& a, const ProtocolVersion& b) { return !(b < a); }
bool operator>(const ProtocolVersion& a, const ProtocolVersion& b) { return b < a; }
bool operator>=(const ProtocolVersion& a, const ProtocolVersion& b) { return !(a < b); }

bool operator==(const PropertyState& a, const PropertyState& b) {
  return a.value == b.value && a.visible == b.visible;
}

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    if (addr.empty()) {
      return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  if (host.empty()) {
    return fail("host must not be empty");
  }
  if (timeout.count() <= 0 || ack_timeout.count() <= 0 ||
      callback_timeout.count() <= 0) {
    return fail("timeouts must be positive");
  }
  if (max_retries <= 0 || discovery_attempts <= 0) {
    return fail("retry counts must be positive");
  }
  if (max_retries > kMaxAttempts) {
    return fail("max_retries must be at most " + std::to_string(kMaxAttempts));
  }
  if (discovery_attempts > kMaxAttempts) {
    return fail("discovery_attempts must be at most " + std::to_string(kMaxAttempts));
  }
  if (base_backoff.count() < 0 || discovery_backoff.count() < 0 ||
      stop_grace.count() < 0) {
    return fail("backoff and grace durations must not be negative");
  }
  if (command_concurrency <= 0 || dispatcher_workers <= 0) {
    return fail("command_concurrency and dispatcher_workers must be positive");
  }
  if (base_backoff > kMaxBackoff || discovery_backoff > kMaxBackoff) {
    return fail("base_backoff and discovery_backoff must not exceed " +
                std::to_string(kMaxBackoff.count()) + "ms");
  }
  if (discovery_port == 0) {
    return fail("discovery_port must be non-zero");
  }
  if (!is_valid_ipv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  const ProtocolVersion parsed = ProtocolVersion::Parse(max_protocol_version);
  if (parsed.ToString() != max_protocol_version) {
    return fail("max_protocol_version must look like MAJOR.MINOR");
  }
  return true;
}

}  // namespace emotiva
