#include "emotiva/discovery.h"

#include "emotiva/errors.h"
#include "emotiva/xml_codec.h"
#include "udp_socket.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

namespace emotiva {
namespace {

constexpr size_t kMaxDatagramSize = 65535;

}  // namespace

DiscoveryOptions DiscoveryOptions::FromConfig(const Config& config) {
  DiscoveryOptions options;
  options.port = config.discovery_port;
  options.response_port = config.discovery_response_port;
  options.attempts = config.discovery_attempts;
  options.backoff = config.discovery_backoff;
  options.max_version = ProtocolVersion::Parse(config.max_protocol_version);
  options.bind_address = config.bind_address;
  return options;
}

Discovery::Discovery(DiscoveryOptions options, Diagnostics& diagnostics)
    : options_(std::move(options)), diagnostics_(diagnostics) {}

Transponder Discovery::FetchTransponder(const std::string& host,
                                        std::chrono::milliseconds timeout) {
  std::string last_cause = "no attempts made";
  auto delay = options_.backoff;
  for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
    try {
      Transponder transponder = Attempt(host, timeout);
      diagnostics_.LogInfo("discovered " + transponder.model + " '" +
                           transponder.device_name + "' at " + host + ", protocol " +
                           transponder.version.ToString());
      return transponder;
    } catch (const NetworkError& ex) {
      last_cause = ex.what();
    } catch (const ReceiveTimeoutError& ex) {
      last_cause = ex.what();
    }
    diagnostics_.LogDebug("discovery attempt " + std::to_string(attempt) + " of " +
                          std::to_string(options_.attempts) + " failed: " + last_cause);
    if (attempt < options_.attempts) {
      diagnostics_.RecordRetry();
      std::this_thread::sleep_for(delay);
      delay = std::min(delay * 2, kMaxBackoff);
    }
  }
  throw DiscoveryError("no transponder from " + host + " after " +
                       std::to_string(options_.attempts) + " attempts: " + last_cause);
}

Transponder Discovery::Attempt(const std::string& host, std::chrono::milliseconds timeout) {
  UdpSocket socket;
  if (!socket.Open(options_.response_port, options_.bind_address, true)) {
    throw NetworkError(socket.last_error());
  }
  const sockaddr_in device = ResolveAddress(host, options_.port);
  const std::string ping = EncodePing(options_.max_version);
  const ssize_t sent = socket.SendTo(ping, device);
  if (sent < 0 || static_cast<size_t>(sent) != ping.size()) {
    diagnostics_.RecordSendError();
    throw NetworkError("ping to " + host + " failed: " +
                       (sent < 0 ? std::string(std::strerror(errno)) : "short write"));
  }
  diagnostics_.RecordPacketSent();

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, kMaxDatagramSize> buffer{};
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw ReceiveTimeoutError("no transponder within " + std::to_string(timeout.count()) +
                                "ms");
    }
    const int ready = socket.WaitReadable(
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (ready < 0) {
      throw NetworkError("select failed: " + std::string(std::strerror(errno)));
    }
    if (ready == 0) {
      continue;
    }
    sockaddr_in source{};
    const ssize_t received = socket.RecvFrom(buffer.data(), buffer.size(), &source);
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw NetworkError("recvfrom failed: " + std::string(std::strerror(errno)));
    }
    diagnostics_.RecordPacketReceived();
    const std::string payload(buffer.data(), static_cast<size_t>(received));
    try {
      return ParseTransponder(Decode(payload), AddrToString(source));
    } catch (const MalformedMessageError& ex) {
      diagnostics_.RecordParseError();
      throw DiscoveryError("malformed transponder from " + host + ": " + ex.what());
    }
  }
}

}  // namespace emotiva
