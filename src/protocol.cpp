#include "emotiva/protocol.h"

#include "emotiva/errors.h"
#include "emotiva/xml_codec.h"

#include <algorithm>
#include <set>
#include <utility>

namespace emotiva {
namespace {

bool AckMatches(const XmlElement& root, const std::string& command) {
  if (root.children.empty()) {
    return true;
  }
  return root.Child(command) != nullptr;
}

std::string JoinNames(const std::vector<std::string>& names) {
  std::string joined;
  for (const auto& name : names) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += name;
  }
  return joined;
}

}  // namespace

ProtocolOptions ProtocolOptions::FromConfig(const Config& config) {
  ProtocolOptions options;
  options.ack_timeout = config.ack_timeout;
  options.max_retries = config.max_retries;
  options.base_backoff = config.base_backoff;
  options.command_concurrency = config.command_concurrency;
  return options;
}

// Holds one concurrency slot for the duration of a call.
class Protocol::Permit {
 public:
  explicit Permit(Protocol& protocol) : protocol_(protocol) { protocol_.AcquirePermit(); }
  ~Permit() { protocol_.ReleasePermit(); }

  Permit(const Permit&) = delete;
  Permit& operator=(const Permit&) = delete;

 private:
  Protocol& protocol_;
};

Protocol::Protocol(std::shared_ptr<Transport> transport,
                   ProtocolVersion version,
                   ProtocolOptions options,
                   Diagnostics& diagnostics)
    : transport_(std::move(transport)),
      version_(version),
      options_(options),
      diagnostics_(diagnostics),
      available_permits_(std::max(1, options.command_concurrency)) {}

void Protocol::AcquirePermit() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return available_permits_ > 0 || cancelled_.load(); });
  if (cancelled_) {
    throw CancelledError("protocol cancelled");
  }
  --available_permits_;
}

void Protocol::ReleasePermit() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++available_permits_;
  }
  cv_.notify_one();
}

void Protocol::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void Protocol::Backoff(int failed_attempt) {
  std::chrono::milliseconds delay = options_.base_backoff;
  for (int i = 1; i < failed_attempt && delay < kMaxBackoff; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, kMaxBackoff);
  std::function<void(std::chrono::milliseconds)> observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = backoff_observer_;
  }
  if (observer) {
    observer(delay);
  }
  diagnostics_.RecordRetry();
  std::unique_lock<std::mutex> lock(mutex_);
  if (cv_.wait_for(lock, delay, [this]() { return cancelled_.load(); })) {
    throw CancelledError("protocol cancelled during backoff");
  }
}

std::optional<XmlElement> Protocol::SendCommand(
    const std::string& name, const std::map<std::string, std::string>& attributes) {
  Command command;
  command.name = name;
  command.attributes = attributes;
  auto value = command.attributes.find("value");
  if (value != command.attributes.end()) {
    command.value = value->second;
    command.attributes.erase(value);
  }
  auto ack = command.attributes.find("ack");
  if (ack != command.attributes.end()) {
    command.ack = ack->second != "no";
    command.attributes.erase(ack);
  }
  return SendCommand(command);
}

std::optional<XmlElement> Protocol::SendCommand(const Command& command) {
  Permit permit(*this);
  const std::string payload = EncodeCommand(command);
  if (!command.ack) {
    transport_->Send(payload, PortRole::kControl);
    diagnostics_.LogDebug("sent " + command.name + " (no ack requested)");
    return std::nullopt;
  }

  std::string failure = "No ack received for command '" + command.name + "'";
  bool network_failure = false;
  std::string network_message;
  for (int attempt = 1; attempt <= options_.max_retries; ++attempt) {
    try {
      transport_->Send(payload, PortRole::kControl);
      const Datagram reply = transport_->Recv(PortRole::kControl, options_.ack_timeout);
      XmlElement root;
      try {
        root = Decode(reply.payload);
      } catch (const MalformedMessageError&) {
        diagnostics_.RecordParseError();
        throw;
      }
      if (root.tag == kAckTag && AckMatches(root, command.name)) {
        diagnostics_.LogDebug("ack for " + command.name);
        return root;
      }
      failure = root.tag == kAckTag
                    ? "Ack for another command while waiting for '" + command.name + "'"
                    : "Unexpected response: " + root.tag;
      network_failure = false;
    } catch (const ReceiveTimeoutError&) {
      failure = "No ack received for command '" + command.name + "'";
      network_failure = false;
    } catch (const NetworkError& ex) {
      network_message = ex.what();
      network_failure = true;
    }
    diagnostics_.LogDebug(command.name + " attempt " + std::to_string(attempt) + " failed: " +
                          (network_failure ? network_message : failure));
    if (attempt < options_.max_retries) {
      Backoff(attempt);
    }
  }
  if (network_failure) {
    throw NetworkError(network_message);
  }
  diagnostics_.RecordAckTimeout();
  diagnostics_.LogWarning(failure);
  throw AckTimeoutError(failure + " after " + std::to_string(options_.max_retries) +
                        " attempts");
}

PropertyMap Protocol::RequestProperties(const std::vector<std::string>& names,
                                        std::chrono::milliseconds timeout) {
  Permit permit(*this);
  const std::string payload = EncodeUpdate(names, version_);
  const std::set<std::string> wanted(names.begin(), names.end());
  PropertyMap collected;

  for (int attempt = 1; attempt <= options_.max_retries; ++attempt) {
    try {
      transport_->Send(payload, PortRole::kControl);
      if (wanted.empty()) {
        return collected;
      }
      const auto deadline = std::chrono::steady_clock::now() + timeout;
      while (collected.size() < wanted.size()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
          break;
        }
        Datagram reply;
        try {
          reply = transport_->Recv(
              PortRole::kControl,
              std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        } catch (const ReceiveTimeoutError&) {
          break;
        }
        XmlElement root;
        try {
          root = Decode(reply.payload);
        } catch (const MalformedMessageError& ex) {
          diagnostics_.RecordParseError();
          diagnostics_.LogWarning(std::string("ignoring malformed reply: ") + ex.what());
          continue;
        }
        if (root.tag != kNotifyTag) {
          diagnostics_.LogDebug("skipping " + root.tag + " while polling properties");
          continue;
        }
        for (const auto& entry : ExtractProperties(root)) {
          if (wanted.count(entry.first) != 0) {
            collected[entry.first] = entry.second;
          }
        }
      }
      if (collected.size() < wanted.size()) {
        diagnostics_.LogDebug("property poll returned " + std::to_string(collected.size()) +
                              " of " + std::to_string(wanted.size()) + " values");
      }
      return collected;
    } catch (const NetworkError& ex) {
      diagnostics_.LogWarning("property poll [" + JoinNames(names) + "] failed: " + ex.what());
      if (attempt == options_.max_retries) {
        throw;
      }
    }
    Backoff(attempt);
  }
  return collected;
}

SubscriptionMap Protocol::Subscribe(const std::vector<std::string>& names) {
  Permit permit(*this);
  return ExchangeSubscription(EncodeSubscribe(names, version_), kSubscriptionTag, names);
}

SubscriptionMap Protocol::Unsubscribe(const std::vector<std::string>& names) {
  Permit permit(*this);
  return ExchangeSubscription(EncodeUnsubscribe(names), kUnsubscribeTag, names);
}

SubscriptionMap Protocol::ExchangeSubscription(const std::string& payload,
                                               const char* reply_tag,
                                               const std::vector<std::string>& names) {
  bool timed_out = false;
  bool network_failure = false;
  std::string network_message;
  for (int attempt = 1; attempt <= options_.max_retries; ++attempt) {
    try {
      transport_->Send(payload, PortRole::kControl);
      const Datagram reply = transport_->Recv(PortRole::kControl, options_.ack_timeout);
      XmlElement root;
      try {
        root = Decode(reply.payload);
      } catch (const MalformedMessageError&) {
        diagnostics_.RecordParseError();
        throw;
      }
      if (root.tag == reply_tag) {
        SubscriptionMap results = ExtractSubscriptionResults(root);
        diagnostics_.LogDebug(std::string(reply_tag) + " acknowledged " +
                              std::to_string(results.size()) + " of " +
                              std::to_string(names.size()) + " properties");
        return results;
      }
      diagnostics_.LogDebug(std::string("expected ") + reply_tag + ", got " + root.tag);
      timed_out = false;
      network_failure = false;
    } catch (const ReceiveTimeoutError&) {
      timed_out = true;
      network_failure = false;
    } catch (const NetworkError& ex) {
      network_message = ex.what();
      network_failure = true;
      timed_out = false;
    }
    if (attempt < options_.max_retries) {
      Backoff(attempt);
    }
  }
  if (network_failure) {
    throw NetworkError(network_message);
  }
  if (timed_out) {
    diagnostics_.RecordAckTimeout();
    throw AckTimeoutError("No subscription confirmation received for [" + JoinNames(names) +
                          "] after " + std::to_string(options_.max_retries) + " attempts");
  }
  diagnostics_.LogWarning(std::string("no ") + reply_tag + " reply for [" + JoinNames(names) +
                          "]");
  return {};
}

#ifdef EMOTIVA_TESTING
namespace test {

void SetBackoffObserver(Protocol& protocol,
                        std::function<void(std::chrono::milliseconds)> observer) {
  std::lock_guard<std::mutex> lock(protocol.mutex_);
  protocol.backoff_observer_ = std::move(observer);
}

}  // namespace test
#endif

}  // namespace emotiva
