// Example: connect to a receiver, subscribe to a few properties and print
// notifications until Enter is pressed.
#include "emotiva/client.h"
#include "emotiva/errors.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <host> [property...]" << std::endl;
    return 2;
  }

  emotiva::Config config;
  config.host = argv[1];
  config.log_level = emotiva::LogLevel::kInfo;

  std::vector<std::string> properties;
  for (int i = 2; i < argc; ++i) {
    properties.push_back(argv[i]);
  }
  if (properties.empty()) {
    properties = {"power", "volume", "mode", "source"};
  }

  emotiva::Client client(config);
  for (const auto& name : properties) {
    client.On(name, [name](const std::string& value) {
      std::cout << name << " = " << value << std::endl;
    });
  }

  try {
    client.Connect();
    const auto transponder = client.GetTransponder();
    std::cout << "Connected to " << transponder->model << " (" << transponder->device_name
              << ") protocol " << client.GetProtocolVersion()->ToString() << std::endl;

    const emotiva::SubscriptionMap subscribed = client.Subscribe(properties);
    for (const auto& entry : subscribed) {
      std::cout << "  " << entry.first << " = " << entry.second.value
                << (entry.second.visible ? "" : " (hidden)") << std::endl;
    }
  } catch (const std::exception& ex) {
    std::cerr << "Failed to connect: " << ex.what() << std::endl;
    return 1;
  }

  std::cout << "Listening. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  client.Disconnect();

  const emotiva::ClientMetrics metrics = client.GetMetrics();
  std::cout << "notifications=" << metrics.notifications
            << " retries=" << metrics.retries << std::endl;
  return 0;
}
