#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/json_codec.hpp"

using relay::storage::common::ToJson;

static void Usage() {
  std::cout << "Usage:\n"
            << "  relayctl <config.yaml> records       dump every JSON-RPC history record\n"
            << "  relayctl <config.yaml> pending       list unanswered requests ready for replay\n"
            << "  relayctl <config.yaml> expirations   list tracked topic expirations\n"
            << "  relayctl <config.yaml> sweep         drop elapsed expirations and persist\n";
}

static int PrintRecords(relay::factory::RuntimeDependencies& deps) {
  for (const auto& record : deps.history->Values()) std::cout << ToJson(record) << "\n";
  std::cout << deps.history->Size() << " record(s)\n";
  return 0;
}

static int PrintPending(relay::factory::RuntimeDependencies& deps) {
  const auto pending = deps.history->Pending();
  for (const auto& request : pending) std::cout << ToJson(request) << "\n";
  std::cout << pending.size() << " pending request(s)\n";
  return 0;
}

static int PrintExpirations(relay::factory::RuntimeDependencies& deps) {
  for (const auto& expiration : deps.expirer->Values()) std::cout << expiration.topic() << " " << expiration.expiry() << "\n";
  std::cout << deps.expirer->Length() << " expiration(s)\n";
  return 0;
}

static int Sweep(relay::factory::RuntimeDependencies& deps) {
  size_t expired = 0;
  deps.expirer->Events().expired.Connect([&](const relay::expirer::ExpirerEvent& event) {
    std::cout << "expired " << event.topic << "\n";
    ++expired;
  });

  // one manual pulse; the heartbeat thread is never started here
  deps.heartbeat->Pulse();

  std::cout << expired << " expiration(s) removed, " << deps.expirer->Length() << " remaining\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc != 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  try {
    auto config = relay::config::ConfigLoader::LoadFromYaml(config_path);
    relay::observability::InitializeLogging(config);

    auto deps = relay::factory::BuildRuntime(config, nullptr);
    deps.history->Init();
    deps.expirer->Init();

    int rc = 1;
    if (command == "records") {
      rc = PrintRecords(deps);
    } else if (command == "pending") {
      rc = PrintPending(deps);
    } else if (command == "expirations") {
      rc = PrintExpirations(deps);
    } else if (command == "sweep") {
      rc = Sweep(deps);
    } else {
      Usage();
    }

    relay::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("Fatal error", {relay::observability::StringField("error", e.what())});
    relay::observability::ShutdownLogging();
    return 2;
  }
}
