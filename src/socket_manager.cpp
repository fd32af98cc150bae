#include "emotiva/socket_manager.h"

#include "emotiva/errors.h"
#include "udp_socket.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <utility>

namespace emotiva {
namespace {

constexpr size_t kMaxDatagramSize = 65535;
// Longest single select() wait, so a concurrent Stop() is noticed quickly.
constexpr std::chrono::milliseconds kRecvSlice{100};

}  // namespace

struct SocketManager::RoleSocket {
  UdpSocket socket;
  sockaddr_in remote{};
  std::atomic<bool> closed{false};
};

SocketManager::SocketManager(std::string host, std::string bind_address,
                             Diagnostics& diagnostics)
    : host_(std::move(host)),
      bind_address_(std::move(bind_address)),
      diagnostics_(diagnostics) {}

SocketManager::~SocketManager() { Stop(); }

void SocketManager::Start(const PortMap& ports) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sockets_.empty()) {
    if (ports == ports_) {
      return;
    }
    throw ConcurrencyError("socket manager already started with a different port map");
  }

  std::map<PortRole, std::shared_ptr<RoleSocket>> opened;
  for (const auto& entry : ports) {
    auto role_socket = std::make_shared<RoleSocket>();
    role_socket->remote = ResolveAddress(host_, entry.second);
    if (!role_socket->socket.Open(entry.second, bind_address_, true)) {
      const std::string message = std::string(PortRoleName(entry.first)) + ": " +
                                  role_socket->socket.last_error();
      for (auto& bound : opened) {
        bound.second->closed = true;
        bound.second->socket.Close();
      }
      diagnostics_.LogError(message);
      throw NetworkError(message);
    }
    diagnostics_.LogDebug(std::string("bound ") + PortRoleName(entry.first) + " on port " +
                          std::to_string(entry.second));
    opened.emplace(entry.first, std::move(role_socket));
  }
  sockets_ = std::move(opened);
  ports_ = ports;
}

void SocketManager::Stop() {
  std::map<PortRole, std::shared_ptr<RoleSocket>> sockets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sockets.swap(sockets_);
    ports_.clear();
  }
  // Receivers still holding a socket see the flag within one slice; the fd
  // is closed when the last holder lets go.
  for (auto& entry : sockets) {
    entry.second->closed = true;
  }
}

bool SocketManager::IsStarted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !sockets_.empty();
}

std::set<PortRole> SocketManager::BoundRoles() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<PortRole> roles;
  for (const auto& entry : sockets_) {
    roles.insert(entry.first);
  }
  return roles;
}

std::shared_ptr<SocketManager::RoleSocket> SocketManager::Lookup(PortRole role) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sockets_.find(role);
  if (it == sockets_.end()) {
    throw NetworkError(std::string("no socket bound for ") + PortRoleName(role));
  }
  return it->second;
}

void SocketManager::Send(const std::string& payload, PortRole role) {
  auto role_socket = Lookup(role);
  const ssize_t sent = role_socket->socket.SendTo(payload, role_socket->remote);
  if (sent < 0 || static_cast<size_t>(sent) != payload.size()) {
    diagnostics_.RecordSendError();
    const std::string reason = sent < 0 ? std::strerror(errno) : "short write";
    throw NetworkError(std::string("send on ") + PortRoleName(role) + " failed: " + reason);
  }
  diagnostics_.RecordPacketSent();
}

Datagram SocketManager::Recv(PortRole role, std::chrono::milliseconds timeout) {
  auto role_socket = Lookup(role);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, kMaxDatagramSize> buffer{};
  while (true) {
    if (role_socket->closed) {
      throw NetworkError(std::string("socket for ") + PortRoleName(role) + " closed");
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw ReceiveTimeoutError(std::string("no datagram on ") + PortRoleName(role) +
                                " within " + std::to_string(timeout.count()) + "ms");
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const int ready = role_socket->socket.WaitReadable(std::min(remaining, kRecvSlice));
    if (ready < 0) {
      throw NetworkError(std::string("select on ") + PortRoleName(role) +
                         " failed: " + std::strerror(errno));
    }
    if (ready == 0) {
      continue;
    }
    sockaddr_in source{};
    const ssize_t received = role_socket->socket.RecvFrom(buffer.data(), buffer.size(), &source);
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      throw NetworkError(std::string("recvfrom on ") + PortRoleName(role) +
                         " failed: " + std::strerror(errno));
    }
    diagnostics_.RecordPacketReceived();
    return Datagram{std::string(buffer.data(), static_cast<size_t>(received)),
                    AddrToString(source)};
  }
}

}  // namespace emotiva
