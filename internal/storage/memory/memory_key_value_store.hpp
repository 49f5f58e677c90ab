#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "internal/storage/key_value_store.hpp"

namespace relay::storage {

/*
  In-memory storage backend.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class MemoryKeyValueStore final : public KeyValueStore {
 public:
  MemoryKeyValueStore()           = default;
  ~MemoryKeyValueStore() override = default;

  std::vector<std::string> GetKeys() override;

  std::optional<std::string> GetItem(const std::string& key) override;

  void SetItem(const std::string& key, const std::string& value) override;

  void RemoveItem(const std::string& key) override;

 private:
  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, std::string> items_;
};

} // namespace relay::storage
