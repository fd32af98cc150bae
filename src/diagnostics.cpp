#include "emotiva/diagnostics.h"

#include <iostream>
#include <utility>

namespace emotiva {
namespace {

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "log";
}

}  // namespace

Diagnostics::Diagnostics(LogLevel level, Config::LogCallback sink)
    : level_(level), sink_(std::move(sink)) {}

void Diagnostics::Log(LogLevel level, const std::string& message) const {
  if (level < level_) {
    return;
  }
  if (sink_) {
    sink_(level, message);
    return;
  }
  std::cerr << "[emotiva] " << LevelName(level) << ": " << message << std::endl;
}

ClientMetrics Diagnostics::Snapshot() const {
  ClientMetrics snapshot;
  snapshot.packets_received = packets_received_.load();
  snapshot.packets_sent = packets_sent_.load();
  snapshot.parse_errors = parse_errors_.load();
  snapshot.send_errors = send_errors_.load();
  snapshot.retries = retries_.load();
  snapshot.ack_timeouts = ack_timeouts_.load();
  snapshot.notifications = notifications_.load();
  snapshot.stale_sequences = stale_sequences_.load();
  snapshot.callback_exceptions = callback_exceptions_.load();
  snapshot.callback_timeouts = callback_timeouts_.load();
  snapshot.missed_keepalives = missed_keepalives_.load();
  return snapshot;
}

}  // namespace emotiva
