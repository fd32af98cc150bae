// Tests for the connection lifecycle and end-to-end notification flow.
#include "emotiva/client.h"
#include "emotiva/errors.h"
#include "emotiva/test_hooks.h"
#include "emotiva/xml_codec.h"
#include "fake_transport.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using emotiva::PortRole;
using emotiva::testing::FakeTransport;
using emotiva::testing::Xml;

namespace {

emotiva::Transponder MakeTransponder(
    emotiva::ProtocolVersion version,
    std::optional<std::chrono::milliseconds> keepalive_interval = std::nullopt) {
  emotiva::Transponder transponder;
  transponder.keepalive_interval = keepalive_interval;
  transponder.model = "XMC-2";
  transponder.device_name = "Theater";
  transponder.version = version;
  transponder.ports = emotiva::testing::DefaultPorts();
  return transponder;
}

emotiva::Config TestConfig() {
  emotiva::Config config;
  config.host = "127.0.0.1";
  config.ack_timeout = std::chrono::milliseconds(100);
  config.base_backoff = std::chrono::milliseconds(1);
  config.stop_grace = std::chrono::milliseconds(200);
  config.log_level = emotiva::LogLevel::kError;
  return config;
}

class Latch {
 public:
  void Add(const std::string& value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      values_.push_back(value);
    }
    cv_.notify_all();
  }

  bool WaitForCount(size_t count) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(2),
                        [&]() { return values_.size() >= count; });
  }

  std::vector<std::string> Values() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> values_;
};

class ClientTest : public ::testing::Test {
 protected:
  void Prepare(emotiva::Client& client,
               emotiva::ProtocolVersion device_version,
               std::optional<std::chrono::milliseconds> keepalive_interval = std::nullopt) {
    emotiva::test::SetDiscoveryFunction(
        client, [this, device_version, keepalive_interval](const std::string&,
                                                            std::chrono::milliseconds) {
          ++discoveries_;
          std::this_thread::sleep_for(std::chrono::milliseconds(20));
          return MakeTransponder(device_version, keepalive_interval);
        });
    emotiva::test::SetTransportFactory(client, [this](const emotiva::Transponder&) {
      auto transport = std::make_shared<FakeTransport>();
      emotiva::testing::InstallDeviceResponder(transport, {{"power", "On"}});
      std::lock_guard<std::mutex> lock(mutex_);
      transport_ = transport;
      return transport;
    });
  }

  std::shared_ptr<FakeTransport> transport() {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_;
  }

  std::atomic<int> discoveries_{0};
  std::mutex mutex_;
  std::shared_ptr<FakeTransport> transport_;
};

}  // namespace

TEST_F(ClientTest, ConcurrentConnectsShareOneDiscovery) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 5; ++i) {
    threads.emplace_back([&]() {
      try {
        client.Connect();
      } catch (const std::exception&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(discoveries_.load(), 1);
  EXPECT_EQ(transport()->start_count(), 1);
  EXPECT_EQ(client.State(), emotiva::ConnectionState::kConnected);
}

TEST_F(ClientTest, NegotiatesLowerVersion) {
  emotiva::Config config = TestConfig();
  config.max_protocol_version = "3.0";
  emotiva::Client client(config);
  Prepare(client, {3, 1});
  client.Connect();
  ASSERT_TRUE(client.GetProtocolVersion().has_value());
  EXPECT_EQ(*client.GetProtocolVersion(), (emotiva::ProtocolVersion{3, 0}));
  ASSERT_TRUE(client.GetTransponder().has_value());
  EXPECT_EQ(client.GetTransponder()->model, "XMC-2");
}

TEST_F(ClientTest, DiscoveryFailureLeavesClientDisconnected) {
  emotiva::Client client(TestConfig());
  emotiva::test::SetDiscoveryFunction(
      client, [](const std::string& host, std::chrono::milliseconds) -> emotiva::Transponder {
        throw emotiva::DiscoveryError("no transponder from " + host);
      });
  EXPECT_THROW(client.Connect(), emotiva::DiscoveryError);
  EXPECT_EQ(client.State(), emotiva::ConnectionState::kDisconnected);
  EXPECT_NE(client.GetLastError().find("no transponder"), std::string::npos);
  EXPECT_FALSE(client.GetTransponder().has_value());
}

TEST_F(ClientTest, BindFailureRollsBack) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  emotiva::test::SetTransportFactory(client, [this](const emotiva::Transponder&) {
    auto transport = std::make_shared<FakeTransport>();
    transport->FailStart(true);
    std::lock_guard<std::mutex> lock(mutex_);
    transport_ = transport;
    return transport;
  });
  EXPECT_THROW(client.Connect(), emotiva::NetworkError);
  EXPECT_EQ(client.State(), emotiva::ConnectionState::kDisconnected);
  EXPECT_FALSE(transport()->IsStarted());
}

TEST_F(ClientTest, OperationsRequireConnection) {
  emotiva::Client client(TestConfig());
  EXPECT_THROW(client.SendCommand("power_on"), emotiva::NetworkError);
  EXPECT_THROW(client.Subscribe({"power"}), emotiva::NetworkError);
  EXPECT_THROW(client.RequestProperties({"power"}), emotiva::NetworkError);
  EXPECT_NO_THROW(client.Disconnect());
}

TEST_F(ClientTest, LegacyDeviceDrivesPowerCallback) {
  emotiva::Client client(TestConfig());
  Prepare(client, {2, 0});
  Latch power;
  client.On("power", [&power](const std::string& value) { power.Add(value); });
  client.Connect();
  EXPECT_EQ(*client.GetProtocolVersion(), (emotiva::ProtocolVersion{2, 0}));

  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify><power>On</power></emotivaNotify>"));
  ASSERT_TRUE(power.WaitForCount(1));
  EXPECT_EQ(power.Values(), (std::vector<std::string>{"On"}));
}

TEST_F(ClientTest, TaggedDeviceFiresEachListenerOnce) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  Latch power;
  Latch volume;
  client.On("power", [&power](const std::string& value) { power.Add(value); });
  client.On("volume", [&volume](const std::string& value) { volume.Add(value); });
  client.Connect();

  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify sequence=\"7\">"
                        "<property name=\"power\" value=\"On\"/>"
                        "<property name=\"volume\" value=\"-20\"/>"
                        "<property name=\"mute\" value=\"Off\"/></emotivaNotify>"));
  ASSERT_TRUE(power.WaitForCount(1));
  ASSERT_TRUE(volume.WaitForCount(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(power.Values().size(), 1u);
  EXPECT_EQ(volume.Values().size(), 1u);
  EXPECT_EQ(client.GetMetrics().notifications, 1u);
}

TEST_F(ClientTest, CommandsAndPollsGoThroughProtocol) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  client.Connect();

  const std::optional<emotiva::XmlElement> ack = client.SendCommand("power_on");
  ASSERT_TRUE(ack.has_value());
  EXPECT_EQ(ack->tag, emotiva::kAckTag);
  EXPECT_FALSE(client.SendCommand("power_on", {{"ack", "no"}}).has_value());
  const emotiva::PropertyMap values =
      client.RequestProperties({"power", "volume"}, std::chrono::milliseconds(100));
  EXPECT_EQ(values, (emotiva::PropertyMap{{"power", "On"}}));
}

TEST_F(ClientTest, DisconnectUnsubscribesAndStopsTransport) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  client.Connect();

  const emotiva::SubscriptionMap subscribed = client.Subscribe({"power", "volume"});
  EXPECT_EQ(subscribed.size(), 2u);
  auto fake = transport();

  client.Disconnect();
  EXPECT_EQ(client.State(), emotiva::ConnectionState::kDisconnected);
  EXPECT_FALSE(fake->IsStarted());
  EXPECT_FALSE(client.GetTransponder().has_value());

  const auto sent = fake->Sent();
  ASSERT_FALSE(sent.empty());
  const emotiva::XmlElement last = emotiva::Decode(sent.back().payload);
  EXPECT_EQ(last.tag, emotiva::kUnsubscribeTag);
  EXPECT_EQ(last.children.size(), 2u);

  EXPECT_THROW(client.SendCommand("power_on"), emotiva::NetworkError);
}

TEST_F(ClientTest, ListenersSurviveReconnect) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  Latch power;
  client.On("power", [&power](const std::string& value) { power.Add(value); });

  client.Connect();
  client.Disconnect();
  client.Connect();
  EXPECT_EQ(discoveries_.load(), 2);

  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify><property name=\"power\" value=\"Off\"/>"
                        "</emotivaNotify>"));
  ASSERT_TRUE(power.WaitForCount(1));
  EXPECT_EQ(power.Values(), (std::vector<std::string>{"Off"}));
}

TEST_F(ClientTest, ListenerAddedWhileConnectedIsLive) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  client.Connect();

  Latch volume;
  client.On("volume", [&volume](const std::string& value) { volume.Add(value); });
  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify><property name=\"volume\" value=\"-40\"/>"
                        "</emotivaNotify>"));
  ASSERT_TRUE(volume.WaitForCount(1));
}

TEST_F(ClientTest, DisconnectFromInsideCallbackCompletes) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  std::atomic<bool> returned{false};
  std::atomic<bool> threw{false};
  client.On("power", [&](const std::string& value) {
    if (value != "Off") {
      return;
    }
    try {
      client.Disconnect();
    } catch (const std::exception&) {
      threw = true;
    }
    returned = true;
  });
  client.Connect();
  auto fake = transport();

  fake->Push(PortRole::kNotify,
             Xml("<emotivaNotify><property name=\"power\" value=\"Off\"/></emotivaNotify>"));
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!returned && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_TRUE(returned.load());
  EXPECT_FALSE(threw.load());
  EXPECT_EQ(client.State(), emotiva::ConnectionState::kDisconnected);
  EXPECT_FALSE(fake->IsStarted());

  client.Connect();
  EXPECT_TRUE(client.IsConnected());
}

TEST_F(ClientTest, ListenerAddedWhileDispatcherStartsIsKept) {
  Latch power;
  std::atomic<emotiva::Client*> target{nullptr};
  std::atomic<bool> added{false};
  emotiva::Config config = TestConfig();
  config.log_level = emotiva::LogLevel::kDebug;
  config.log_callback = [&](emotiva::LogLevel, const std::string& message) {
    emotiva::Client* client = target.load();
    if (client == nullptr || message.find("dispatcher started") == std::string::npos ||
        added.exchange(true)) {
      return;
    }
    client->On("power", [&power](const std::string& value) { power.Add(value); });
  };
  emotiva::Client client(config);
  target = &client;
  Prepare(client, {3, 1});
  client.Connect();
  ASSERT_TRUE(added.load());

  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify><property name=\"power\" value=\"On\"/>"
                        "</emotivaNotify>"));
  ASSERT_TRUE(power.WaitForCount(1));
  EXPECT_EQ(power.Values(), (std::vector<std::string>{"On"}));
}

TEST_F(ClientTest, StateCallbackSeesEveryTransition) {
  using emotiva::ConnectionState;
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  std::mutex mutex;
  std::vector<std::pair<ConnectionState, ConnectionState>> seen;
  client.SetConnectionStateCallback(
      [&](ConnectionState previous, ConnectionState current) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.emplace_back(previous, current);
      });

  client.Connect();
  client.Disconnect();

  std::lock_guard<std::mutex> lock(mutex);
  const std::vector<std::pair<ConnectionState, ConnectionState>> expected = {
      {ConnectionState::kDisconnected, ConnectionState::kConnecting},
      {ConnectionState::kConnecting, ConnectionState::kConnected},
      {ConnectionState::kConnected, ConnectionState::kDisconnecting},
      {ConnectionState::kDisconnecting, ConnectionState::kDisconnected},
  };
  EXPECT_EQ(seen, expected);
}

TEST_F(ClientTest, FailedConnectReportsRollbackToStateCallback) {
  using emotiva::ConnectionState;
  emotiva::Client client(TestConfig());
  emotiva::test::SetDiscoveryFunction(
      client, [](const std::string&, std::chrono::milliseconds) -> emotiva::Transponder {
        throw emotiva::DiscoveryError("no transponder");
      });
  std::vector<ConnectionState> states;
  client.SetConnectionStateCallback(
      [&states](ConnectionState, ConnectionState current) { states.push_back(current); });

  EXPECT_THROW(client.Connect(), emotiva::DiscoveryError);
  EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::kConnecting,
                                                  ConnectionState::kDisconnected}));
}

TEST_F(ClientTest, OffStopsDelivery) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1});
  Latch removed;
  Latch kept;
  const emotiva::ListenerId id =
      client.On("power", [&removed](const std::string& value) { removed.Add(value); });
  client.On("power", [&kept](const std::string& value) { kept.Add(value); });
  client.Connect();

  EXPECT_TRUE(client.Off(id));
  EXPECT_FALSE(client.Off(id));
  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify><property name=\"power\" value=\"Off\"/>"
                        "</emotivaNotify>"));
  ASSERT_TRUE(kept.WaitForCount(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_TRUE(removed.Values().empty());

  client.Disconnect();
  client.Connect();
  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify><property name=\"power\" value=\"On\"/>"
                        "</emotivaNotify>"));
  ASSERT_TRUE(kept.WaitForCount(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_TRUE(removed.Values().empty());
}

TEST_F(ClientTest, SilentDeviceTriggersKeepAliveCallback) {
  emotiva::Client client(TestConfig());
  Prepare(client, {3, 1}, std::chrono::milliseconds(50));
  Latch liveness;
  client.SetKeepAliveCallback(
      [&liveness](bool responsive) { liveness.Add(responsive ? "up" : "down"); });
  client.Connect();
  EXPECT_TRUE(client.IsDeviceResponsive());

  ASSERT_TRUE(liveness.WaitForCount(1));
  EXPECT_FALSE(client.IsDeviceResponsive());
  EXPECT_EQ(client.State(), emotiva::ConnectionState::kConnected);
  EXPECT_EQ(client.GetMetrics().missed_keepalives, 1u);

  transport()->Push(PortRole::kNotify,
                    Xml("<emotivaNotify><property name=\"keepalive\" value=\"50\"/>"
                        "</emotivaNotify>"));
  ASSERT_TRUE(liveness.WaitForCount(2));
  const std::vector<std::string> values = liveness.Values();
  EXPECT_EQ(values[0], "down");
  EXPECT_EQ(values[1], "up");
  EXPECT_TRUE(client.LastKeepAlive().has_value());
}
