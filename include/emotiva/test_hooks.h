#pragma once

#include "emotiva/client.h"
#include "emotiva/protocol.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace emotiva {

#ifdef EMOTIVA_TESTING
namespace test {

/// Replace the discovery exchange used by Connect().
void SetDiscoveryFunction(Client& client, DiscoveryFunction discover);

/// Replace the SocketManager that Connect() builds for each connection.
void SetTransportFactory(Client& client, TransportFactory factory);

/// Observe every backoff delay before the protocol sleeps on it.
void SetBackoffObserver(Protocol& protocol,
                        std::function<void(std::chrono::milliseconds)> observer);

}  // namespace test
#endif

}  // namespace emotiva
