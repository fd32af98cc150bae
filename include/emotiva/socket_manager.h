#pragma once

#include "emotiva/diagnostics.h"
#include "emotiva/types.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace emotiva {

/**
 * One received datagram and the address it came from.
 */
struct Datagram {
  std::string payload;
  std::string source_address;
};

/**
 * Per-role datagram transport to a single device.
 *
 * Protocol and Dispatcher talk only to this interface so tests can replace
 * the network with an in-memory fake.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * Bind one local socket per role. All-or-nothing: on failure every socket
   * bound by this call is closed again.
   *
   * @throws NetworkError if any bind fails.
   * @throws ConcurrencyError if already started with a different port map.
   */
  virtual void Start(const PortMap& ports) = 0;
  /// Close all sockets. Safe to call repeatedly.
  virtual void Stop() = 0;
  virtual bool IsStarted() const = 0;
  virtual std::set<PortRole> BoundRoles() const = 0;

  /**
   * Send a datagram to the device port of the given role.
   *
   * @throws NetworkError if the role is unbound or the send fails.
   */
  virtual void Send(const std::string& payload, PortRole role) = 0;

  /**
   * Wait for one datagram on the given role's socket.
   *
   * @throws ReceiveTimeoutError if nothing arrives within `timeout`.
   * @throws NetworkError if the role is unbound or the socket is closed.
   */
  virtual Datagram Recv(PortRole role, std::chrono::milliseconds timeout) = 0;
};

/**
 * UDP Transport: one socket per role, bound locally to the same port number
 * the device advertised for that role.
 */
class SocketManager : public Transport {
 public:
  SocketManager(std::string host, std::string bind_address, Diagnostics& diagnostics);
  ~SocketManager() override;

  SocketManager(const SocketManager&) = delete;
  SocketManager& operator=(const SocketManager&) = delete;

  void Start(const PortMap& ports) override;
  void Stop() override;
  bool IsStarted() const override;
  std::set<PortRole> BoundRoles() const override;

  void Send(const std::string& payload, PortRole role) override;
  Datagram Recv(PortRole role, std::chrono::milliseconds timeout) override;

 private:
  struct RoleSocket;

  std::shared_ptr<RoleSocket> Lookup(PortRole role) const;

  std::string host_;
  std::string bind_address_;
  Diagnostics& diagnostics_;

  mutable std::mutex mutex_;
  PortMap ports_;
  std::map<PortRole, std::shared_ptr<RoleSocket>> sockets_;
};

}  // namespace emotiva
