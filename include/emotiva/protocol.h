#pragma once

#include "emotiva/diagnostics.h"
#include "emotiva/socket_manager.h"
#include "emotiva/types.h"
#include "emotiva/xml_codec.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace emotiva {

class Protocol;

#ifdef EMOTIVA_TESTING
namespace test {
void SetBackoffObserver(Protocol& protocol,
                        std::function<void(std::chrono::milliseconds)> observer);
}  // namespace test
#endif

/**
 * Retry and concurrency tuning for Protocol, normally taken from Config.
 */
struct ProtocolOptions {
  std::chrono::milliseconds ack_timeout{2000};
  int max_retries = 3;
  std::chrono::milliseconds base_backoff{200};
  int command_concurrency = 5;

  static ProtocolOptions FromConfig(const Config& config);
};

/**
 * Request/response exchanges with a connected device.
 *
 * Thread-safe: calls from several threads share the transport, bounded by
 * `command_concurrency`. Every call retries with exponential backoff.
 */
class Protocol {
 public:
  Protocol(std::shared_ptr<Transport> transport,
           ProtocolVersion version,
           ProtocolOptions options,
           Diagnostics& diagnostics);

  Protocol(const Protocol&) = delete;
  Protocol& operator=(const Protocol&) = delete;

  const ProtocolVersion& version() const { return version_; }

  /**
   * Send a command and wait for its acknowledgment.
   *
   * @return The decoded ack addressed to this command, or nullopt when the
   *         command asked for no ack.
   * @throws AckTimeoutError if no matching ack arrives within the retry budget.
   * @throws NetworkError if the last attempt failed at the socket level.
   * @throws MalformedMessageError if the device answers with invalid XML.
   * @throws CancelledError if Cancel() interrupts the call.
   */
  std::optional<XmlElement> SendCommand(
      const std::string& name, const std::map<std::string, std::string>& attributes = {});
  /// As above; a command with `ack == false` is sent once without waiting.
  std::optional<XmlElement> SendCommand(const Command& command);

  /**
   * Poll property values. Replies are collected on the control port until
   * every name is seen or `timeout` passes; missing names are left out.
   */
  PropertyMap RequestProperties(const std::vector<std::string>& names,
                                std::chrono::milliseconds timeout);

  /// Subscribe to change notifications; returns the acknowledged entries.
  SubscriptionMap Subscribe(const std::vector<std::string>& names);
  /// Cancel subscriptions; returns the acknowledged entries.
  SubscriptionMap Unsubscribe(const std::vector<std::string>& names);

  /// Fail pending and future calls with CancelledError.
  void Cancel();
  bool IsCancelled() const { return cancelled_.load(); }

 private:
  class Permit;

  void AcquirePermit();
  void ReleasePermit();
  void Backoff(int failed_attempt);
  SubscriptionMap ExchangeSubscription(const std::string& payload,
                                       const char* reply_tag,
                                       const std::vector<std::string>& names);

#ifdef EMOTIVA_TESTING
  friend void test::SetBackoffObserver(Protocol& protocol,
                                       std::function<void(std::chrono::milliseconds)> observer);
#endif

  std::shared_ptr<Transport> transport_;
  ProtocolVersion version_;
  ProtocolOptions options_;
  Diagnostics& diagnostics_;

  std::mutex mutex_;
  std::condition_variable cv_;
  int available_permits_ = 0;
  std::atomic<bool> cancelled_{false};
  std::function<void(std::chrono::milliseconds)> backoff_observer_;
};

}  // namespace emotiva
