#pragma once

#include <memory>
#include <mutex>

#include "internal/storage/key_value_store.hpp"
#include "sqlite_db.hpp"

namespace relay::storage::sqlite {

/*
  SQLite storage backend.

  One row per key in kv_store; every SetItem is an upsert that also
  stamps updated_at_ms. Calls are serialized on the shared connection.
*/
class SqliteKeyValueStore final : public KeyValueStore {
 public:
  explicit SqliteKeyValueStore(std::shared_ptr<SqliteDB> db);

  std::vector<std::string> GetKeys() override;

  std::optional<std::string> GetItem(const std::string& key) override;

  void SetItem(const std::string& key, const std::string& value) override;

  void RemoveItem(const std::string& key) override;

 private:
  void Bootstrap();

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace relay::storage::sqlite
