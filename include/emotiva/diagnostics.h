#pragma once

#include "emotiva/types.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace emotiva {

/**
 * Log sink and metrics counters shared by the components of one client.
 *
 * Components hold a reference; the owner (Client, or a test) keeps it alive.
 */
class Diagnostics {
 public:
  Diagnostics() = default;
  Diagnostics(LogLevel level, Config::LogCallback sink);

  Diagnostics(const Diagnostics&) = delete;
  Diagnostics& operator=(const Diagnostics&) = delete;

  void Log(LogLevel level, const std::string& message) const;
  void LogDebug(const std::string& message) const { Log(LogLevel::kDebug, message); }
  void LogInfo(const std::string& message) const { Log(LogLevel::kInfo, message); }
  void LogWarning(const std::string& message) const { Log(LogLevel::kWarning, message); }
  void LogError(const std::string& message) const { Log(LogLevel::kError, message); }

  void RecordPacketSent() { packets_sent_.fetch_add(1); }
  void RecordPacketReceived() { packets_received_.fetch_add(1); }
  void RecordParseError() { parse_errors_.fetch_add(1); }
  void RecordSendError() { send_errors_.fetch_add(1); }
  void RecordRetry() { retries_.fetch_add(1); }
  void RecordAckTimeout() { ack_timeouts_.fetch_add(1); }
  void RecordNotification() { notifications_.fetch_add(1); }
  void RecordStaleSequence() { stale_sequences_.fetch_add(1); }
  void RecordCallbackException() { callback_exceptions_.fetch_add(1); }
  void RecordCallbackTimeout() { callback_timeouts_.fetch_add(1); }
  void RecordMissedKeepAlive() { missed_keepalives_.fetch_add(1); }

  ClientMetrics Snapshot() const;

 private:
  LogLevel level_ = LogLevel::kWarning;
  Config::LogCallback sink_;

  std::atomic<uint64_t> packets_received_{0};
  std::atomic<uint64_t> packets_sent_{0};
  std::atomic<uint64_t> parse_errors_{0};
  std::atomic<uint64_t> send_errors_{0};
  std::atomic<uint64_t> retries_{0};
  std::atomic<uint64_t> ack_timeouts_{0};
  std::atomic<uint64_t> notifications_{0};
  std::atomic<uint64_t> stale_sequences_{0};
  std::atomic<uint64_t> callback_exceptions_{0};
  std::atomic<uint64_t> callback_timeouts_{0};
  std::atomic<uint64_t> missed_keepalives_{0};
};

}  // namespace emotiva
