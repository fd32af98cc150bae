#pragma once

#include "emotiva/dispatcher.h"
#include "emotiva/errors.h"
#include "emotiva/socket_manager.h"
#include "emotiva/types.h"
#include "emotiva/xml_codec.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace emotiva {

class Client;

/// Receives every connection state transition, after it has happened.
using ConnectionStateCallback =
    std::function<void(ConnectionState previous, ConnectionState current)>;

#ifdef EMOTIVA_TESTING
namespace test {
using DiscoveryFunction =
    std::function<Transponder(const std::string& host, std::chrono::milliseconds timeout)>;
using TransportFactory = std::function<std::shared_ptr<Transport>(const Transponder&)>;

void SetDiscoveryFunction(Client& client, DiscoveryFunction discover);
void SetTransportFactory(Client& client, TransportFactory factory);
}  // namespace test
#endif

/**
 * Connection to one Emotiva processor.
 *
 * Connect() discovers the device, negotiates the protocol version, binds the
 * per-role sockets and starts notification dispatch. All methods are
 * thread-safe; concurrent Connect() calls share one discovery.
 */
class Client {
 public:
  /// Construct a client with the provided configuration.
  explicit Client(Config config);
  /// Disconnect (best effort) and release sockets and threads.
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /**
   * Discover the device and start talking to it. No-op when connected.
   *
   * @throws std::invalid_argument if the configuration is invalid.
   * @throws DiscoveryError, NetworkError on failure; the client is left
   *         disconnected.
   */
  void Connect();
  /// Unsubscribe everything, stop dispatch and close sockets. No-op unless connected.
  void Disconnect();

  /**
   * Send a command; returns the device's ack, or nullopt for `ack == false`.
   *
   * @throws NetworkError("not connected") plus whatever Protocol::SendCommand throws.
   */
  std::optional<XmlElement> SendCommand(
      const std::string& name, const std::map<std::string, std::string>& attributes = {});
  std::optional<XmlElement> SendCommand(const Command& command);
  PropertyMap RequestProperties(const std::vector<std::string>& names,
                                std::chrono::milliseconds timeout = std::chrono::seconds(2));
  SubscriptionMap Subscribe(const std::vector<std::string>& names);
  SubscriptionMap Unsubscribe(const std::vector<std::string>& names);

  /// Register a property callback. Survives reconnects.
  ListenerId On(const std::string& property, PropertyCallback callback);
  /// Register a cancellable long-running property callback. Survives reconnects.
  ListenerId On(const std::string& property, AsyncPropertyCallback callback);
  /// Remove a callback registered with On(). Returns false for unknown ids.
  bool Off(ListenerId id);

  /**
   * Set the callback for connection state transitions.
   *
   * Called on the thread that ran Connect() or Disconnect(), after the
   * connection lock is released.
   */
  void SetConnectionStateCallback(ConnectionStateCallback callback);
  /**
   * Set the callback for keepalive loss and recovery.
   *
   * Called with false once the device has sent nothing for 1.5 of its
   * advertised keepalive intervals, and with true when it is heard again.
   */
  void SetKeepAliveCallback(LivenessCallback callback);

  ConnectionState State() const;
  bool IsConnected() const { return State() == ConnectionState::kConnected; }
  /// Transponder of the current connection, if connected.
  std::optional<Transponder> GetTransponder() const;
  /// Negotiated protocol version, if connected.
  std::optional<ProtocolVersion> GetProtocolVersion() const;
  /// When the device last sent a keepalive notification, if ever.
  std::optional<std::chrono::steady_clock::time_point> LastKeepAlive() const;
  /// False when disconnected or while the device is missing keepalives.
  bool IsDeviceResponsive() const;
  /// Return the last Connect() error message, if any.
  std::string GetLastError() const;
  /// Return metrics for packets, errors, and callbacks.
  ClientMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef EMOTIVA_TESTING
  friend void test::SetDiscoveryFunction(Client& client, test::DiscoveryFunction discover);
  friend void test::SetTransportFactory(Client& client, test::TransportFactory factory);
#endif
};

}  // namespace emotiva
