#pragma once

#include "config/config.pb.h"
#include "key_value_store.hpp"

namespace relay::storage {

/*
  Builds the configured key-value backend.

      auto store = StorageFactory::Build(config.storage());
      store->SetItem(key, json);
*/
class StorageFactory {
 public:
  static KeyValueStorePtr Build(const relay::runtime::config::StorageConfig& cfg);
};

} // namespace relay::storage
