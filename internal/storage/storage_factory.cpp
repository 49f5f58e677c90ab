#include "storage_factory.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "memory/memory_key_value_store.hpp"
#include "sqlite/sqlite_db.hpp"
#include "sqlite/sqlite_key_value_store.hpp"

namespace relay::storage {

using observability::BoolField;
using observability::StringField;

KeyValueStorePtr StorageFactory::Build(const relay::runtime::config::StorageConfig& cfg) {
  if (cfg.has_sqlite()) {
    const std::filesystem::path path{cfg.sqlite().path()};
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }

    auto db = std::make_shared<sqlite::SqliteDB>(path.string(), cfg.sqlite().wal_mode());
    RELAY_LOG_INFO("Opened sqlite store", {StringField("path", path.string()), BoolField("wal_mode", cfg.sqlite().wal_mode())});
    return std::make_shared<sqlite::SqliteKeyValueStore>(std::move(db));
  }

  RELAY_LOG_INFO("Using in-memory store");
  return std::make_shared<MemoryKeyValueStore>();
}

} // namespace relay::storage
