#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/event/signal.hpp"
#include "internal/lifecycle/init_gate.hpp"
#include "internal/storage/key_value_store.hpp"
#include "relay/v1.hpp"

namespace relay::history {

inline constexpr char kHistoryContext[]        = "history";
inline constexpr char kHistoryStorageVersion[] = "0.3";

struct HistoryEvents {
  event::Signal<relay::v1::JsonRpcRecord> created;
  event::Signal<relay::v1::JsonRpcRecord> updated;
  event::Signal<relay::v1::JsonRpcRecord> deleted;
  event::Signal<>                         sync;
  event::Signal<>                         init;
};

/*
  JSON-RPC request/response correlation ledger.

  Records are keyed by request id only; the topic is checked on read.
  An id reused under a second topic is therefore reported as a
  mismatched topic rather than stored as an independent record.

  Every created/updated/deleted event rewrites the full record list to
  storage under <prefix>0.3//history and then fires `sync`.
*/
class JsonRpcHistory {
 public:
  JsonRpcHistory(storage::KeyValueStorePtr store, std::string storage_prefix);

  JsonRpcHistory(const JsonRpcHistory&)            = delete;
  JsonRpcHistory& operator=(const JsonRpcHistory&) = delete;

  // Restores persisted records and opens the gate. Safe to call again;
  // readiness and `init` fire only the first time.
  void Init();

  // First write wins: a second Set for the same id is ignored.
  void Set(const std::string& topic, const relay::v1::JsonRpcRequest& request, const std::optional<std::string>& chain_id = std::nullopt);

  // Write-once: ignored for unknown ids and already resolved records.
  void Resolve(const relay::v1::JsonRpcResponse& response);

  // Throws util::NoMatchingId or util::MismatchedTopic.
  relay::v1::JsonRpcRecord Get(const std::string& topic, int64_t id);

  void Delete(const std::string& topic, std::optional<int64_t> id = std::nullopt);

  bool Exists(const std::string& topic, int64_t id);

  // Unresolved records as replay-ready requests, rebuilt on every call.
  std::vector<relay::v1::RequestEvent> Pending();

  size_t                                Size() const;
  std::vector<int64_t>                  Keys() const;
  std::vector<relay::v1::JsonRpcRecord> Values() const;

  HistoryEvents& Events() {
    return events_;
  }

  const std::string& Name() const {
    return name_;
  }

  std::string StorageKey() const;

  lifecycle::InitGate::State GateState() const {
    return gate_.CurrentState();
  }

 private:
  std::optional<relay::v1::JsonRpcRecord> FindRecord(int64_t id) const;
  relay::v1::JsonRpcRecord                GetRecord(int64_t id) const;

  std::optional<std::vector<relay::v1::JsonRpcRecord>> GetJsonRpcRecords();

  void Persist();
  void Restore();
  void RegisterEventListeners();

  std::string               name_    = kHistoryContext;
  std::string               version_ = kHistoryStorageVersion;
  std::string               storage_prefix_;
  storage::KeyValueStorePtr store_;

  lifecycle::InitGate gate_{kHistoryContext};
  HistoryEvents       events_;

  mutable std::mutex                          mutex_;
  std::map<int64_t, relay::v1::JsonRpcRecord> records_;
  std::vector<relay::v1::JsonRpcRecord>       cached_;

  std::mutex persist_mutex_;
};

} // namespace relay::history
