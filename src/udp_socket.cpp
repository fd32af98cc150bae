#include "udp_socket.h"

#include "emotiva/errors.h"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace emotiva {

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

sockaddr_in ResolveAddress(const std::string& host, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
    return addr;
  }
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo* results = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &results);
  if (rc != 0 || results == nullptr) {
    throw NetworkError("cannot resolve host '" + host + "': " + ::gai_strerror(rc));
  }
  std::memcpy(&addr.sin_addr,
              &reinterpret_cast<const sockaddr_in*>(results->ai_addr)->sin_addr,
              sizeof(addr.sin_addr));
  ::freeaddrinfo(results);
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

bool UdpSocket::Open(uint16_t port, const std::string& bind_address, bool reuse_address) {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    last_error_ = "socket() failed: " + std::string(std::strerror(errno));
    return false;
  }
  if (reuse_address) {
    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      last_error_ = "setsockopt(SO_REUSEADDR) failed: " + std::string(std::strerror(errno));
      Close();
      return false;
    }
  }
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << bind_address << ":" << port << ") failed: "
        << std::strerror(errno);
    last_error_ = oss.str();
    Close();
    return false;
  }
  return true;
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

uint16_t UdpSocket::LocalPort() const {
  if (fd_ < 0) {
    return 0;
  }
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

ssize_t UdpSocket::SendTo(const std::string& data, const sockaddr_in& addr) {
  return ::sendto(fd_, data.data(), data.size(), 0,
                  reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
}

ssize_t UdpSocket::RecvFrom(char* buffer, size_t length, sockaddr_in* addr) {
  socklen_t addr_len = sizeof(*addr);
  return ::recvfrom(fd_, buffer, length, 0,
                    reinterpret_cast<sockaddr*>(addr), &addr_len);
}

int UdpSocket::WaitReadable(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    errno = EBADF;
    return -1;
  }
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(fd_, &readfds);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(micros / 1000000);
  tv.tv_usec = static_cast<suseconds_t>(micros % 1000000);
  const int ready = ::select(fd_ + 1, &readfds, nullptr, nullptr, &tv);
  if (ready < 0 && errno == EINTR) {
    return 0;
  }
  return ready;
}

}  // namespace emotiva
