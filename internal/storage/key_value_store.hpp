#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay::storage {

/*
  Durable key-value storage abstraction.

  Values are opaque strings (components store protobuf JSON).
  Implementations:
    MEMORY  → process-local map, for tests and ephemeral clients
    SQLITE  → single kv table in a sqlite database

  Backends throw std::runtime_error on I/O failure.
*/
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::vector<std::string> GetKeys() = 0;

  virtual std::optional<std::string> GetItem(const std::string& key) = 0;

  virtual void SetItem(const std::string& key, const std::string& value) = 0;

  virtual void RemoveItem(const std::string& key) = 0;
};

using KeyValueStorePtr = std::shared_ptr<KeyValueStore>;

/*
  Versioned namespaced key: <prefix><version>//<name>
  e.g. "wc@2:client:0.3//history"
*/
inline std::string MakeStorageKey(const std::string& prefix, const std::string& version, const std::string& name) {
  return prefix + version + "//" + name;
}

} // namespace relay::storage
