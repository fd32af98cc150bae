// Thread safety smoke tests for concurrent client use.
#include "emotiva/client.h"
#include "emotiva/test_hooks.h"
#include "fake_transport.h"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace {

std::unique_ptr<emotiva::Client> ConnectedClient() {
  emotiva::Config config;
  config.host = "127.0.0.1";
  config.ack_timeout = std::chrono::milliseconds(50);
  config.base_backoff = std::chrono::milliseconds(1);
  config.log_level = emotiva::LogLevel::kError;
  auto client = std::make_unique<emotiva::Client>(config);
  emotiva::test::SetDiscoveryFunction(*client, [](const std::string&, std::chrono::milliseconds) {
    emotiva::Transponder transponder;
    transponder.version = {3, 1};
    transponder.ports = emotiva::testing::DefaultPorts();
    return transponder;
  });
  emotiva::test::SetTransportFactory(*client, [](const emotiva::Transponder&) {
    auto transport = std::make_shared<emotiva::testing::FakeTransport>();
    emotiva::testing::InstallDeviceResponder(transport, {{"power", "On"}});
    return transport;
  });
  client->Connect();
  return client;
}

}  // namespace

TEST(ThreadSafetyTest, ConcurrentCommandsAreSafe) {
  auto client = ConnectedClient();
  std::atomic<int> errors{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 25; ++i) {
        try {
          client->SendCommand("volume", {{"value", std::to_string(-i)}});
        } catch (const emotiva::Error&) {
          ++errors;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(errors.load(), 0);
}

TEST(ThreadSafetyTest, DisconnectDuringTrafficIsSafe) {
  auto client = ConnectedClient();
  std::atomic<bool> stop{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      while (!stop) {
        try {
          client->SendCommand("power_on");
          client->RequestProperties({"power"}, std::chrono::milliseconds(20));
        } catch (const emotiva::Error&) {
          // Calls racing the disconnect fail with NetworkError or CancelledError.
        }
      }
    });
  }
  threads.emplace_back([&]() {
    for (int i = 0; i < 50; ++i) {
      client->On("power", [](const std::string&) {});
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  client->Disconnect();
  stop = true;
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(client->State(), emotiva::ConnectionState::kDisconnected);
}
