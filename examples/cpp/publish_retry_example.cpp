#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace {

// Stands in for a relay socket that is down for the first few requests.
class FlakyTransport final : public relay::transport::RelayTransport {
 public:
  explicit FlakyTransport(int failures) : failures_(failures) {
  }

  google::protobuf::Value Request(const relay::v1::RequestArguments& request) override {
    if (failures_-- > 0) {
      throw std::runtime_error("relay unreachable");
    }
    std::cout << "relay accepted " << request.method() << '\n';

    google::protobuf::Value ack;
    ack.set_bool_value(true);
    return ack;
  }

 private:
  std::atomic<int> failures_;
};

} // namespace

int main() {
  auto config = relay::config::ConfigLoader::LoadFromYamlString(R"(
logging:
  level: info
storage:
  memory: {}
heartbeat:
  interval: "0.2s"
)");
  relay::observability::InitializeLogging(config);

  auto deps = relay::factory::BuildRuntime(config, std::make_shared<FlakyTransport>(2));
  relay::factory::StartRuntime(deps);

  std::atomic<bool> delivered{false};
  deps.publisher->Events().acknowledged.Connect([&](const std::string& hash, const relay::v1::QueuedPublish&) {
    std::cout << "acknowledged " << hash << '\n';
    delivered = true;
  });

  // The first attempt fails; the message stays queued and the heartbeat
  // keeps resubmitting it until the relay accepts.
  try {
    deps.publisher->Publish("example-topic", "hello from the example");
  } catch (const std::exception& e) {
    std::cout << "first attempt failed: " << e.what() << ", " << deps.publisher->Size() << " queued\n";
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!delivered && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  relay::factory::StopRuntime(deps);
  relay::observability::ShutdownLogging();
  return delivered ? 0 : 1;
}
