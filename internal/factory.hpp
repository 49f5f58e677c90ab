#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/expirer/expirer.hpp"
#include "internal/heartbeat/heartbeat.hpp"
#include "internal/history/json_rpc_history.hpp"
#include "internal/publisher/publisher.hpp"
#include "internal/relay/relay_transport.hpp"
#include "internal/storage/key_value_store.hpp"

namespace relay::factory {

/*
  RuntimeDependencies

  Owns the long-lived components of one relay client.
  publisher is null when no transport was supplied.

  Destruction stops the heartbeat before any component is released, so
  no pulse handler can still be running on a destroyed component.
  Move-constructible only: a copy would share the heartbeat it stops.
*/
struct RuntimeDependencies {
  RuntimeDependencies() = default;
  ~RuntimeDependencies();

  RuntimeDependencies(RuntimeDependencies&&) = default;

  RuntimeDependencies(const RuntimeDependencies&)            = delete;
  RuntimeDependencies& operator=(const RuntimeDependencies&) = delete;
  RuntimeDependencies& operator=(RuntimeDependencies&&)      = delete;

  storage::KeyValueStorePtr             store;
  std::shared_ptr<heartbeat::Heartbeat> heartbeat;

  std::shared_ptr<publisher::Publisher>    publisher;
  std::shared_ptr<history::JsonRpcHistory> history;
  std::shared_ptr<expirer::Expirer>        expirer;
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete store types.
*/
RuntimeDependencies BuildRuntime(const relay::runtime::config::RuntimeConfig& config, transport::RelayTransportPtr transport);

// Restores every component, then starts the heartbeat.
void StartRuntime(RuntimeDependencies& deps);

// Stops the heartbeat so no pulse reaches a component being destroyed.
void StopRuntime(RuntimeDependencies& deps);

} // namespace relay::factory
