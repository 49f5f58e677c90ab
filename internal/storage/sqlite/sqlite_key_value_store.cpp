#include "sqlite_key_value_store.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace relay::storage::sqlite {
namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

void ThrowStep(sqlite3* db, int rc, const char* what) {
  throw std::runtime_error(std::string(what) + " (" + std::to_string(rc) + "): " + sqlite3_errmsg(db));
}

} // namespace

SqliteKeyValueStore::SqliteKeyValueStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Bootstrap();
}

void SqliteKeyValueStore::Bootstrap() {
  db_->Exec("CREATE TABLE IF NOT EXISTS kv_store (key TEXT PRIMARY KEY, value TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);");
}

std::vector<std::string> SqliteKeyValueStore::GetKeys() {
  std::lock_guard lock(mutex_);
  Statement st(db_->Prepare("SELECT key FROM kv_store ORDER BY key;"));

  std::vector<std::string> keys;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) ThrowStep(db_->Handle(), rc, "sqlite list keys");

  return keys;
}

std::optional<std::string> SqliteKeyValueStore::GetItem(const std::string& key) {
  std::lock_guard lock(mutex_);
  Statement st(db_->Prepare("SELECT value FROM kv_store WHERE key=?;"));
  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStep(db_->Handle(), rc, "sqlite get item");

  return ColText(st.get(), 0);
}

void SqliteKeyValueStore::SetItem(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  Statement st(db_->Prepare(
      "INSERT INTO kv_store(key,value,updated_at_ms) VALUES(?,?,?) "
      "ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at_ms=excluded.updated_at_ms;"));
  BindText(st.get(), 1, key);
  BindText(st.get(), 2, value);
  sqlite3_bind_int64(st.get(), 3, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowStep(db_->Handle(), rc, "sqlite set item");
}

void SqliteKeyValueStore::RemoveItem(const std::string& key) {
  std::lock_guard lock(mutex_);
  Statement st(db_->Prepare("DELETE FROM kv_store WHERE key=?;"));
  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowStep(db_->Handle(), rc, "sqlite remove item");
}

} // namespace relay::storage::sqlite
