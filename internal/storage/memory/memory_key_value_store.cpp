#include "memory_key_value_store.hpp"

#include <algorithm>
#include <mutex>

namespace relay::storage {

std::vector<std::string> MemoryKeyValueStore::GetKeys() {
  std::shared_lock lock(mutex_);

  std::vector<std::string> keys;
  keys.reserve(items_.size());
  for (const auto& [key, value] : items_) keys.push_back(key);

  std::sort(keys.begin(), keys.end());
  return keys;
}

std::optional<std::string> MemoryKeyValueStore::GetItem(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = items_.find(key);
  if (it == items_.end()) return std::nullopt;
  return it->second;
}

void MemoryKeyValueStore::SetItem(const std::string& key, const std::string& value) {
  std::unique_lock lock(mutex_);
  items_[key] = value;
}

void MemoryKeyValueStore::RemoveItem(const std::string& key) {
  std::unique_lock lock(mutex_);
  items_.erase(key);
}

} // namespace relay::storage
