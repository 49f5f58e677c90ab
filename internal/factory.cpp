#include "factory.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/relay/relay_api.hpp"
#include "internal/storage/storage_factory.hpp"

namespace relay::factory {

using observability::IntField;
using observability::StringField;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(duration.seconds()) +
                                                               std::chrono::nanoseconds(duration.nanos()));
}

} // namespace

RuntimeDependencies::~RuntimeDependencies() {
  // Stop() joins the pulse thread, so no sweep is in flight past this point
  if (heartbeat) heartbeat->Stop();
}

RuntimeDependencies BuildRuntime(const relay::runtime::config::RuntimeConfig& config, transport::RelayTransportPtr transport) {
  RuntimeDependencies deps;

  deps.store     = storage::StorageFactory::Build(config.storage());
  deps.heartbeat = std::make_shared<heartbeat::Heartbeat>(ToMillis(config.heartbeat().interval()));

  const auto& prefix = config.storage().prefix();
  deps.history       = std::make_shared<history::JsonRpcHistory>(deps.store, prefix);
  deps.expirer       = std::make_shared<expirer::Expirer>(deps.store, deps.heartbeat, prefix);

  if (transport) {
    // reject an unknown protocol at startup rather than on first publish
    transport::GetRelayProtocolApi(config.publisher().relay_protocol());

    publisher::PublisherSettings settings;
    settings.default_ttl    = static_cast<uint64_t>(config.publisher().default_ttl().seconds());
    settings.relay_protocol = config.publisher().relay_protocol();
    deps.publisher          = std::make_shared<publisher::Publisher>(std::move(transport), deps.heartbeat, settings);
  }

  RELAY_LOG_DEBUG("Runtime built", {StringField("storage_prefix", prefix),
                                    IntField("heartbeat_interval_ms", deps.heartbeat->Interval().count())});
  return deps;
}

void StartRuntime(RuntimeDependencies& deps) {
  deps.history->Init();
  deps.expirer->Init();
  if (deps.publisher) deps.publisher->Init();

  deps.heartbeat->Start();
}

void StopRuntime(RuntimeDependencies& deps) {
  if (deps.heartbeat) deps.heartbeat->Stop();
}

} // namespace relay::factory
