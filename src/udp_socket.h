#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <netinet/in.h>
#include <sys/types.h>

namespace emotiva {

// Convert a bind address and port into a sockaddr_in (empty/0.0.0.0 = any).
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port);

// Resolve an IPv4 literal or hostname; throws NetworkError on failure.
sockaddr_in ResolveAddress(const std::string& host, uint16_t port);

std::string AddrToString(const sockaddr_in& addr);

// Minimal UDP socket wrapper for send/recv.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(uint16_t port, const std::string& bind_address, bool reuse_address);
  void Close();

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }
  /// Port the socket is bound to (useful after binding port 0).
  uint16_t LocalPort() const;

  ssize_t SendTo(const std::string& data, const sockaddr_in& addr);
  ssize_t RecvFrom(char* buffer, size_t length, sockaddr_in* addr);

  /// Wait until readable: 1 readable, 0 timed out, -1 error (errno set).
  int WaitReadable(std::chrono::milliseconds timeout);

 private:
  int fd_ = -1;
  std::string last_error_;
};

}  // namespace emotiva
