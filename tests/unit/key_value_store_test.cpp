#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/storage/memory/memory_key_value_store.hpp"
#include "internal/storage/sqlite/sqlite_db.hpp"
#include "internal/storage/sqlite/sqlite_key_value_store.hpp"
#include "internal/storage/storage_factory.hpp"

namespace {

using relay::storage::KeyValueStore;
using relay::storage::MakeStorageKey;
using relay::storage::MemoryKeyValueStore;
using relay::storage::sqlite::SqliteDB;
using relay::storage::sqlite::SqliteKeyValueStore;

std::filesystem::path TempDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "relaycore_key_value_store_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".sqlite");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path;
}

void ExerciseStore(KeyValueStore& store) {
  assert(!store.GetItem("missing").has_value());
  assert(store.GetKeys().empty());

  store.SetItem("b", "{\"records\":[]}");
  store.SetItem("a", "first");
  store.SetItem("a", "second");

  auto value = store.GetItem("a");
  assert(value.has_value());
  assert(*value == "second");

  auto keys = store.GetKeys();
  assert(keys.size() == 2);
  assert(keys[0] == "a");
  assert(keys[1] == "b");

  store.RemoveItem("a");
  store.RemoveItem("never-set");
  assert(!store.GetItem("a").has_value());
  assert(store.GetKeys().size() == 1);
}

void TestStorageKeyFormat() {
  assert(MakeStorageKey("wc@2:client:", "0.3", "history") == "wc@2:client:0.3//history");
}

void TestMemoryStore() {
  MemoryKeyValueStore store;
  ExerciseStore(store);
}

void TestSqliteStore() {
  auto                path = TempDbPath("basic");
  SqliteKeyValueStore store(std::make_shared<SqliteDB>(path.string(), true));
  ExerciseStore(store);
}

void TestSqliteStoreSurvivesReopen() {
  auto path = TempDbPath("reopen");
  {
    SqliteKeyValueStore store(std::make_shared<SqliteDB>(path.string(), false));
    store.SetItem("wc@2:client:0.3//expirer", "{\"expirations\":[{\"topic\":\"t\",\"expiry\":\"10\"}]}");
  }

  SqliteKeyValueStore reopened(std::make_shared<SqliteDB>(path.string(), false));
  auto                value = reopened.GetItem("wc@2:client:0.3//expirer");
  assert(value.has_value());
  assert(*value == "{\"expirations\":[{\"topic\":\"t\",\"expiry\":\"10\"}]}");
}

void TestFactoryHonoursBackendSelection() {
  relay::runtime::config::StorageConfig memory_cfg;
  memory_cfg.mutable_memory();
  assert(std::dynamic_pointer_cast<MemoryKeyValueStore>(relay::storage::StorageFactory::Build(memory_cfg)));

  relay::runtime::config::StorageConfig sqlite_cfg;
  sqlite_cfg.mutable_sqlite()->set_path(TempDbPath("factory").string());
  assert(std::dynamic_pointer_cast<SqliteKeyValueStore>(relay::storage::StorageFactory::Build(sqlite_cfg)));
}

} // namespace

int main() {
  TestStorageKeyFormat();
  TestMemoryStore();
  TestSqliteStore();
  TestSqliteStoreSurvivesReopen();
  TestFactoryHonoursBackendSelection();

  std::cout << "relaycore_unit_key_value_store: pass\n";
  return 0;
}
