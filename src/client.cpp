#include "emotiva/client.h"

#include "emotiva/diagnostics.h"
#include "emotiva/discovery.h"
#include "emotiva/protocol.h"

#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

namespace emotiva {
namespace {

// Runs a cleanup step when the enclosing scope exits, including by exception.
class ScopeExit {
 public:
  explicit ScopeExit(std::function<void()> cleanup) : cleanup_(std::move(cleanup)) {}
  ~ScopeExit() { cleanup_(); }

  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;

 private:
  std::function<void()> cleanup_;
};

}  // namespace

struct Client::Impl {
  using DiscoveryFunction =
      std::function<Transponder(const std::string& host, std::chrono::milliseconds timeout)>;
  using TransportFactory = std::function<std::shared_ptr<Transport>(const Transponder&)>;
  using Transitions = std::vector<std::pair<ConnectionState, ConnectionState>>;

  struct PendingListener {
    ListenerId id = 0;
    std::string property;
    PropertyCallback callback;
    AsyncPropertyCallback async_callback;
    /// Registration on the live dispatcher, if any.
    ListenerId dispatcher_id = 0;
  };

  explicit Impl(Config config)
      : config_(std::move(config)), diagnostics_(config_.log_level, config_.log_callback) {}

  // State callbacks run after connect_mutex_ is released so they may call
  // Connect() or Disconnect() themselves.
  void Connect() {
    Transitions transitions;
    try {
      std::lock_guard<std::mutex> connect_lock(connect_mutex_);
      ConnectLocked(transitions);
    } catch (const std::exception&) {
      NotifyTransitions(transitions);
      throw;
    }
    NotifyTransitions(transitions);
  }

  void Disconnect() {
    Transitions transitions;
    try {
      std::lock_guard<std::mutex> connect_lock(connect_mutex_);
      DisconnectLocked(transitions);
    } catch (const std::exception&) {
      NotifyTransitions(transitions);
      throw;
    }
    NotifyTransitions(transitions);
  }

  void ConnectLocked(Transitions& transitions) {
    if (state_ == ConnectionState::kConnected) {
      return;
    }
    std::string validation_error;
    if (!config_.Validate(&validation_error)) {
      SetLastError(validation_error);
      diagnostics_.LogError("invalid config: " + validation_error);
      throw std::invalid_argument(validation_error);
    }
    SetState(ConnectionState::kConnecting, transitions);

    std::shared_ptr<Transport> transport;
    std::shared_ptr<Dispatcher> dispatcher;
    try {
      const Transponder transponder = Discover();
      const ProtocolVersion version = ProtocolVersion::Negotiate(
          ProtocolVersion::Parse(config_.max_protocol_version), transponder.version);

      if (transport_factory_) {
        transport = transport_factory_(transponder);
      } else {
        transport = std::make_shared<SocketManager>(config_.host, config_.bind_address,
                                                    diagnostics_);
      }
      transport->Start(transponder.ports);

      auto protocol = std::make_shared<Protocol>(
          transport, version, ProtocolOptions::FromConfig(config_), diagnostics_);
      DispatcherOptions dispatcher_options = DispatcherOptions::FromConfig(config_);
      if (transponder.keepalive_interval) {
        dispatcher_options.keepalive_interval = *transponder.keepalive_interval;
      }
      dispatcher = std::make_shared<Dispatcher>(transport, dispatcher_options, diagnostics_);
      dispatcher->SetLivenessCallback([this](bool responsive) { OnLiveness(responsive); });
      {
        // Listeners added from here on register on this dispatcher directly.
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& listener : listeners_) {
          listener.dispatcher_id = Register(*dispatcher, listener);
        }
        dispatcher_ = dispatcher;
      }
      dispatcher->Start();

      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        transport_ = transport;
        protocol_ = std::move(protocol);
        transponder_ = transponder;
        version_ = version;
        last_error_.clear();
      }
      SetState(ConnectionState::kConnected, transitions);
      diagnostics_.LogInfo("connected to " + config_.host + " using protocol " +
                           version.ToString());
    } catch (const std::exception& ex) {
      if (dispatcher) {
        dispatcher->Stop();
      }
      if (transport) {
        transport->Stop();
      }
      Reset();
      SetState(ConnectionState::kDisconnected, transitions);
      SetLastError(ex.what());
      diagnostics_.LogError("connect to " + config_.host + " failed: " + ex.what());
      throw;
    }
  }

  void DisconnectLocked(Transitions& transitions) {
    if (state_ != ConnectionState::kConnected) {
      return;
    }
    transitions.reserve(transitions.size() + 2);
    SetState(ConnectionState::kDisconnecting, transitions);

    std::shared_ptr<Protocol> protocol;
    std::shared_ptr<Dispatcher> dispatcher;
    std::shared_ptr<Transport> transport;
    std::vector<std::string> subscribed;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      protocol = protocol_;
      dispatcher = dispatcher_;
      transport = transport_;
      subscribed.assign(subscribed_.begin(), subscribed_.end());
    }
    {
      ScopeExit teardown([&]() {
        if (transport) {
          transport->Stop();
        }
        Reset();
        SetState(ConnectionState::kDisconnected, transitions);
      });
      if (protocol && !subscribed.empty()) {
        try {
          protocol->Unsubscribe(subscribed);
        } catch (const Error& ex) {
          diagnostics_.LogWarning(std::string("unsubscribe during disconnect failed: ") +
                                  ex.what());
        }
      }
      if (protocol) {
        protocol->Cancel();
      }
      if (dispatcher) {
        dispatcher->Stop();
      }
    }
    diagnostics_.LogInfo("disconnected from " + config_.host);
  }

  void SetState(ConnectionState next, Transitions& transitions) {
    const ConnectionState previous = state_.exchange(next);
    if (previous != next) {
      transitions.emplace_back(previous, next);
    }
  }

  void NotifyTransitions(const Transitions& transitions) {
    if (transitions.empty()) {
      return;
    }
    ConnectionStateCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback = state_callback_;
    }
    if (!callback) {
      return;
    }
    for (const auto& transition : transitions) {
      try {
        callback(transition.first, transition.second);
      } catch (const std::exception& ex) {
        diagnostics_.RecordCallbackException();
        diagnostics_.LogError(std::string("connection state callback threw: ") + ex.what());
      }
    }
  }

  // Runs on a dispatcher worker, which catches and counts exceptions.
  void OnLiveness(bool responsive) {
    LivenessCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback = keepalive_callback_;
    }
    if (callback) {
      callback(responsive);
    }
  }

  std::shared_ptr<Protocol> RequireProtocol() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ConnectionState::kConnected || !protocol_) {
      throw NetworkError("not connected");
    }
    return protocol_;
  }

  SubscriptionMap Subscribe(const std::vector<std::string>& names) {
    auto protocol = RequireProtocol();
    SubscriptionMap results = protocol->Subscribe(names);
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& entry : results) {
      subscribed_.insert(entry.first);
    }
    return results;
  }

  SubscriptionMap Unsubscribe(const std::vector<std::string>& names) {
    auto protocol = RequireProtocol();
    SubscriptionMap results = protocol->Unsubscribe(names);
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto& name : names) {
      subscribed_.erase(name);
    }
    return results;
  }

  ListenerId AddListener(PendingListener listener) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    listener.id = next_listener_id_++;
    if (dispatcher_) {
      listener.dispatcher_id = Register(*dispatcher_, listener);
    }
    const ListenerId id = listener.id;
    listeners_.push_back(std::move(listener));
    return id;
  }

  bool RemoveListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const PendingListener& listener) { return listener.id == id; });
    if (it == listeners_.end()) {
      return false;
    }
    if (dispatcher_ && it->dispatcher_id != 0) {
      dispatcher_->Off(it->dispatcher_id);
    }
    listeners_.erase(it);
    return true;
  }

  std::shared_ptr<Dispatcher> CurrentDispatcher() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return dispatcher_;
  }

  Transponder Discover() {
    if (discovery_function_) {
      return discovery_function_(config_.host, config_.timeout);
    }
    Discovery discovery(DiscoveryOptions::FromConfig(config_), diagnostics_);
    return discovery.FetchTransponder(config_.host, config_.timeout);
  }

  static ListenerId Register(Dispatcher& dispatcher, const PendingListener& listener) {
    if (listener.async_callback) {
      return dispatcher.On(listener.property, listener.async_callback);
    }
    return dispatcher.On(listener.property, listener.callback);
  }

  void Reset() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    transport_.reset();
    protocol_.reset();
    dispatcher_.reset();
    transponder_.reset();
    version_.reset();
    subscribed_.clear();
    for (auto& listener : listeners_) {
      listener.dispatcher_id = 0;
    }
  }

  void SetLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = message;
  }

  Config config_;
  Diagnostics diagnostics_;

  std::mutex connect_mutex_;
  std::atomic<ConnectionState> state_{ConnectionState::kDisconnected};

  mutable std::mutex state_mutex_;
  std::shared_ptr<Transport> transport_;
  std::shared_ptr<Protocol> protocol_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::optional<Transponder> transponder_;
  std::optional<ProtocolVersion> version_;
  std::set<std::string> subscribed_;
  std::vector<PendingListener> listeners_;
  ListenerId next_listener_id_ = 1;
  std::string last_error_;

  std::mutex callback_mutex_;
  ConnectionStateCallback state_callback_;
  LivenessCallback keepalive_callback_;

  DiscoveryFunction discovery_function_;
  TransportFactory transport_factory_;
};

Client::Client(Config config) : impl_(new Impl(std::move(config))) {}

Client::~Client() { impl_->Disconnect(); }

void Client::Connect() { impl_->Connect(); }
void Client::Disconnect() { impl_->Disconnect(); }

std::optional<XmlElement> Client::SendCommand(
    const std::string& name, const std::map<std::string, std::string>& attributes) {
  return impl_->RequireProtocol()->SendCommand(name, attributes);
}

std::optional<XmlElement> Client::SendCommand(const Command& command) {
  return impl_->RequireProtocol()->SendCommand(command);
}

PropertyMap Client::RequestProperties(const std::vector<std::string>& names,
                                      std::chrono::milliseconds timeout) {
  return impl_->RequireProtocol()->RequestProperties(names, timeout);
}

SubscriptionMap Client::Subscribe(const std::vector<std::string>& names) {
  return impl_->Subscribe(names);
}

SubscriptionMap Client::Unsubscribe(const std::vector<std::string>& names) {
  return impl_->Unsubscribe(names);
}

ListenerId Client::On(const std::string& property, PropertyCallback callback) {
  if (!callback) {
    return 0;
  }
  Impl::PendingListener listener;
  listener.property = property;
  listener.callback = std::move(callback);
  return impl_->AddListener(std::move(listener));
}

ListenerId Client::On(const std::string& property, AsyncPropertyCallback callback) {
  if (!callback) {
    return 0;
  }
  Impl::PendingListener listener;
  listener.property = property;
  listener.async_callback = std::move(callback);
  return impl_->AddListener(std::move(listener));
}

bool Client::Off(ListenerId id) { return impl_->RemoveListener(id); }

void Client::SetConnectionStateCallback(ConnectionStateCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->state_callback_ = std::move(callback);
}

void Client::SetKeepAliveCallback(LivenessCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex_);
  impl_->keepalive_callback_ = std::move(callback);
}

ConnectionState Client::State() const { return impl_->state_.load(); }

std::optional<Transponder> Client::GetTransponder() const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex_);
  return impl_->transponder_;
}

std::optional<ProtocolVersion> Client::GetProtocolVersion() const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex_);
  return impl_->version_;
}

std::optional<std::chrono::steady_clock::time_point> Client::LastKeepAlive() const {
  auto dispatcher = impl_->CurrentDispatcher();
  if (!dispatcher) {
    return std::nullopt;
  }
  return dispatcher->LastKeepAlive();
}

bool Client::IsDeviceResponsive() const {
  auto dispatcher = impl_->CurrentDispatcher();
  return dispatcher && IsConnected() && dispatcher->IsDeviceResponsive();
}

std::string Client::GetLastError() const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex_);
  return impl_->last_error_;
}

ClientMetrics Client::GetMetrics() const { return impl_->diagnostics_.Snapshot(); }

#ifdef EMOTIVA_TESTING
namespace test {

void SetDiscoveryFunction(Client& client, DiscoveryFunction discover) {
  std::lock_guard<std::mutex> lock(client.impl_->connect_mutex_);
  client.impl_->discovery_function_ = std::move(discover);
}

void SetTransportFactory(Client& client, TransportFactory factory) {
  std::lock_guard<std::mutex> lock(client.impl_->connect_mutex_);
  client.impl_->transport_factory_ = std::move(factory);
}

}  // namespace test
#endif

}  // namespace emotiva
