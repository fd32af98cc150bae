#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace emotiva {

/**
 * Fixed UDP port a device listens on for discovery pings.
 */
constexpr uint16_t kDiscoveryPort = 7000;

/// Upper bound for max_retries and discovery_attempts.
constexpr int kMaxAttempts = 10;
/// Ceiling for any single retry delay, including doubled ones.
constexpr std::chrono::milliseconds kMaxBackoff{30000};

/**
 * Logical port roles advertised by the transponder.
 */
enum class PortRole {
  kControl,
  kNotify,
  kInfo,
  kMenuNotify,
  kSetup,
};

/// Role name used in log messages and in the transponder XML.
const char* PortRoleName(PortRole role);

using PortMap = std::map<PortRole, uint16_t>;

/**
 * Protocol version (major.minor) with ordering.
 */
struct ProtocolVersion {
  int major = 1;
  int minor = 0;

  /// Parse "X.Y"; anything unparseable yields 1.0.
  static ProtocolVersion Parse(const std::string& text);
  /// The lower of the configured maximum and the device-reported version.
  static ProtocolVersion Negotiate(const ProtocolVersion& configured_max,
                                   const ProtocolVersion& device_reported);

  std::string ToString() const;
  /// True when the version uses `property` tags and the protocol attribute.
  bool UsesTaggedProperties() const { return major >= 3; }
};

bool operator==(const ProtocolVersion& a, const ProtocolVersion& b);
bool operator!=(const ProtocolVersion& a, const ProtocolVersion& b);
bool operator<(const ProtocolVersion& a, const ProtocolVersion& b);
bool operator<=(const ProtocolVersion& a, const ProtocolVersion& b);
bool operator>(const ProtocolVersion& a, const ProtocolVersion& b);
bool operator>=(const ProtocolVersion& a, const ProtocolVersion& b);

/**
 * A control command. Consumed once by Protocol.
 */
struct Command {
  /// Command element name (e.g. "power_on", "volume").
  std::string name;
  /// Optional scalar value; encoded as "0" when absent.
  std::optional<std::string> value;
  /// Whether the device must acknowledge the command.
  bool ack = true;
  /// Extra attributes passed through verbatim.
  std::map<std::string, std::string> attributes;
};

/// Property name -> value as reported by the device.
using PropertyMap = std::map<std::string, std::string>;

/**
 * Subscription outcome for one property.
 */
struct PropertyState {
  std::string value;
  bool visible = false;
};

bool operator==(const PropertyState& a, const PropertyState& b);

using SubscriptionMap = std::map<std::string, PropertyState>;

/**
 * One decoded notification datagram.
 */
struct Notification {
  /// Sequence number from the `sequence` attribute, when present.
  std::optional<uint64_t> sequence;
  PropertyMap properties;
};

/**
 * Device self-description returned by a discovery ping.
 */
struct Transponder {
  /// Model name (e.g. "XMC-2").
  std::string model;
  /// Firmware/protocol revision string as reported.
  std::string revision;
  /// User-assigned device name.
  std::string device_name;
  /// Protocol version the device speaks.
  ProtocolVersion version;
  /// Port assignments per role.
  PortMap ports;
  /// Keep-alive interval advertised by the device.
  std::optional<std::chrono::milliseconds> keepalive_interval;
  /// Setup XML version, if advertised.
  std::optional<int> setup_xml_version;
  /// Address the response came from.
  std::string source_address;
};

enum class ConnectionState {
  kDisconnected,
  kConnecting,
  kConnected,
  kDisconnecting,
};

const char* ConnectionStateName(ConnectionState state);

enum class LogLevel {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

/**
 * Lightweight counters for packet flow and error reporting.
 */
struct ClientMetrics {
  uint64_t packets_received = 0;
  uint64_t packets_sent = 0;
  uint64_t parse_errors = 0;
  uint64_t send_errors = 0;
  uint64_t retries = 0;
  uint64_t ack_timeouts = 0;
  uint64_t notifications = 0;
  uint64_t stale_sequences = 0;
  uint64_t callback_exceptions = 0;
  uint64_t callback_timeouts = 0;
  uint64_t missed_keepalives = 0;
};

/**
 * Client configuration: device address, negotiation and retry tuning.
 */
struct Config {
  using LogCallback = std::function<void(LogLevel, const std::string&)>;

  /// Device IPv4 address or hostname.
  std::string host;
  /// Discovery receive timeout per attempt.
  std::chrono::milliseconds timeout{2000};
  /// Highest protocol version offered to the device.
  std::string max_protocol_version = "3.1";

  /// Per-attempt wait for an ack or subscription confirmation.
  std::chrono::milliseconds ack_timeout{2000};
  /// Attempts per protocol call (includes the first).
  int max_retries = 3;
  /// Delay before the first retry; doubled for each further retry.
  std::chrono::milliseconds base_backoff{200};
  /// Maximum number of protocol calls in flight at once.
  int command_concurrency = 5;

  /// Deadline for cooperative (async) callbacks.
  std::chrono::milliseconds callback_timeout{5000};
  /// Worker threads running notification callbacks.
  int dispatcher_workers = 4;
  /// How long Dispatcher::Stop waits for running callbacks before logging.
  std::chrono::milliseconds stop_grace{1000};

  /// Device port discovery pings are sent to.
  uint16_t discovery_port = kDiscoveryPort;
  /// Local port for the transponder reply (0 picks an ephemeral port).
  uint16_t discovery_response_port = 0;
  /// Discovery attempts before giving up.
  int discovery_attempts = 3;
  /// Delay before the first discovery retry; doubled each retry.
  std::chrono::milliseconds discovery_backoff{250};

  /// Local bind address for the per-role sockets.
  std::string bind_address = "0.0.0.0";

  /// Minimum level forwarded to the log sink.
  LogLevel log_level = LogLevel::kWarning;
  /// Optional log sink (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

}  // namespace emotiva
