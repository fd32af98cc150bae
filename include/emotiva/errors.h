#pragma once

#include <stdexcept>
#include <string>

namespace emotiva {

/**
 * Base class for every error raised by the library.
 */
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Device unreachable, or its transponder response is unusable.
class DiscoveryError : public Error {
 public:
  using Error::Error;
};

/// OS-level socket failure, closed socket, or no connection.
class NetworkError : public Error {
 public:
  using Error::Error;
};

/// No datagram arrived on a port within the requested time.
class ReceiveTimeoutError : public Error {
 public:
  using Error::Error;
};

/// A command's acknowledgment did not arrive within the retry budget.
class AckTimeoutError : public Error {
 public:
  using Error::Error;
};

/// A datagram could not be parsed as protocol XML.
class MalformedMessageError : public Error {
 public:
  using Error::Error;
};

/// Lifecycle misuse, such as starting an already-started component.
class ConcurrencyError : public Error {
 public:
  using Error::Error;
};

/// A pending call was interrupted because the connection is going away.
class CancelledError : public Error {
 public:
  using Error::Error;
};

}  // namespace emotiva
