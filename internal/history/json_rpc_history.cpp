#include "json_rpc_history.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/json_codec.hpp"
#include "internal/util/errors.hpp"

namespace relay::history {

using observability::IntField;
using observability::StringField;
using relay::v1::JsonRpcRecord;
using relay::v1::JsonRpcRecordList;
using relay::v1::JsonRpcRequest;
using relay::v1::JsonRpcResponse;
using relay::v1::RequestEvent;

namespace {

constexpr char kJsonRpcVersion[] = "2.0";

// JSON cannot encode a Value without a kind; store those as null.
google::protobuf::Value OrNull(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::KIND_NOT_SET) return value;

  google::protobuf::Value null_value;
  null_value.set_null_value(google::protobuf::NULL_VALUE);
  return null_value;
}

} // namespace

JsonRpcHistory::JsonRpcHistory(storage::KeyValueStorePtr store, std::string storage_prefix)
    : storage_prefix_(std::move(storage_prefix)), store_(std::move(store)) {
  if (!store_) throw std::invalid_argument("history requires a key-value store");
  RegisterEventListeners();
}

std::string JsonRpcHistory::StorageKey() const {
  return storage::MakeStorageKey(storage_prefix_, version_, name_);
}

void JsonRpcHistory::Init() {
  gate_.BeginRestore();
  RELAY_LOG_TRACE("Initialized", {StringField("context", name_)});

  Restore();

  {
    std::lock_guard lock(mutex_);
    for (auto& record : cached_) {
      const auto id = record.id();
      records_.emplace(id, std::move(record));
    }
    cached_.clear();
  }

  if (gate_.MarkReady()) {
    events_.init.Emit();
  }
}

// ------------------------------------------------------------
// Set
// ------------------------------------------------------------

void JsonRpcHistory::Set(const std::string& topic, const JsonRpcRequest& request, const std::optional<std::string>& chain_id) {
  gate_.Wait();
  RELAY_LOG_DEBUG("Setting JSON-RPC request history record", {StringField("context", name_)});
  RELAY_LOG_TRACE("set", {StringField("context", name_), StringField("topic", topic), IntField("id", request.id()),
                          StringField("method", request.method())});

  JsonRpcRecord record;
  record.set_id(request.id());
  record.set_topic(topic);
  record.mutable_request()->set_method(request.method());
  *record.mutable_request()->mutable_params() = OrNull(request.params());
  if (chain_id) record.set_chain_id(*chain_id);

  {
    std::lock_guard lock(mutex_);
    if (!records_.emplace(record.id(), record).second) return;
  }

  events_.created.Emit(record);
}

// ------------------------------------------------------------
// Resolve
// ------------------------------------------------------------

void JsonRpcHistory::Resolve(const JsonRpcResponse& response) {
  gate_.Wait();
  RELAY_LOG_DEBUG("Updating JSON-RPC response history record", {StringField("context", name_)});
  RELAY_LOG_TRACE("update", {StringField("context", name_), IntField("id", response.id())});

  JsonRpcRecord record;
  {
    std::lock_guard lock(mutex_);

    auto it = records_.find(response.id());
    if (it == records_.end()) return;
    if (it->second.has_response()) return;

    auto* stored = it->second.mutable_response();
    if (response.has_error()) {
      *stored->mutable_error() = response.error();
    } else {
      *stored->mutable_result() = OrNull(response.result());
    }
    record = it->second;
  }

  events_.updated.Emit(record);
}

// ------------------------------------------------------------
// Get / Exists
// ------------------------------------------------------------

JsonRpcRecord JsonRpcHistory::Get(const std::string& topic, int64_t id) {
  gate_.Wait();
  RELAY_LOG_DEBUG("Getting record", {StringField("context", name_)});
  RELAY_LOG_TRACE("get", {StringField("context", name_), StringField("topic", topic), IntField("id", id)});

  auto record = GetRecord(id);
  if (record.topic() != topic) {
    throw util::MismatchedTopic("Mismatched topic for " + name_ + " with id: " + std::to_string(id));
  }
  return record;
}

bool JsonRpcHistory::Exists(const std::string& topic, int64_t id) {
  gate_.Wait();

  auto record = FindRecord(id);
  return record && record->topic() == topic;
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void JsonRpcHistory::Delete(const std::string& topic, std::optional<int64_t> id) {
  gate_.Wait();
  RELAY_LOG_DEBUG("Deleting record", {StringField("context", name_)});
  RELAY_LOG_TRACE("delete", {StringField("context", name_), StringField("topic", topic), IntField("id", id.value_or(-1))});

  std::vector<JsonRpcRecord> removed;
  {
    std::lock_guard lock(mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
      if (it->second.topic() != topic || (id && it->first != *id)) {
        ++it;
        continue;
      }
      removed.push_back(std::move(it->second));
      it = records_.erase(it);
    }
  }

  for (const auto& record : removed) {
    events_.deleted.Emit(record);
  }
}

// ------------------------------------------------------------
// Views
// ------------------------------------------------------------

std::vector<RequestEvent> JsonRpcHistory::Pending() {
  gate_.Wait();

  std::vector<RequestEvent> requests;

  std::lock_guard lock(mutex_);
  for (const auto& [id, record] : records_) {
    if (record.has_response()) continue;

    RequestEvent event;
    event.set_topic(record.topic());

    auto* request = event.mutable_request();
    request->set_id(record.id());
    request->set_jsonrpc(kJsonRpcVersion);
    request->set_method(record.request().method());
    *request->mutable_params() = OrNull(record.request().params());

    if (record.has_chain_id()) event.set_chain_id(record.chain_id());
    requests.push_back(std::move(event));
  }
  return requests;
}

size_t JsonRpcHistory::Size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

std::vector<int64_t> JsonRpcHistory::Keys() const {
  std::lock_guard lock(mutex_);

  std::vector<int64_t> keys;
  keys.reserve(records_.size());
  for (const auto& [id, record] : records_) keys.push_back(id);
  return keys;
}

std::vector<JsonRpcRecord> JsonRpcHistory::Values() const {
  std::lock_guard lock(mutex_);

  std::vector<JsonRpcRecord> values;
  values.reserve(records_.size());
  for (const auto& [id, record] : records_) values.push_back(record);
  return values;
}

// ------------------------------------------------------------
// Private
// ------------------------------------------------------------

std::optional<JsonRpcRecord> JsonRpcHistory::FindRecord(int64_t id) const {
  std::lock_guard lock(mutex_);

  auto it = records_.find(id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

JsonRpcRecord JsonRpcHistory::GetRecord(int64_t id) const {
  auto record = FindRecord(id);
  if (!record) {
    throw util::NoMatchingId("No matching " + name_ + " with id: " + std::to_string(id));
  }
  return *record;
}

std::optional<std::vector<JsonRpcRecord>> JsonRpcHistory::GetJsonRpcRecords() {
  auto json = store_->GetItem(StorageKey());
  if (!json) return std::nullopt;

  auto list = storage::common::FromJson<JsonRpcRecordList>(*json);
  return std::vector<JsonRpcRecord>(list.records().begin(), list.records().end());
}

void JsonRpcHistory::Persist() {
  try {
    std::lock_guard persist_lock(persist_mutex_);

    JsonRpcRecordList list;
    for (auto& record : Values()) *list.add_records() = std::move(record);

    store_->SetItem(StorageKey(), storage::common::ToJson(list));
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("Failed to persist records", {StringField("context", name_), StringField("error", e.what())});
    return;
  }

  events_.sync.Emit();
}

void JsonRpcHistory::Restore() {
  try {
    auto persisted = GetJsonRpcRecords();
    if (!persisted || persisted->empty()) return;

    std::lock_guard lock(mutex_);
    if (!records_.empty()) {
      throw util::RestoreWillOverride(name_);
    }
    cached_ = std::move(*persisted);

    RELAY_LOG_DEBUG("Successfully Restored records", {StringField("context", name_), IntField("count", static_cast<int64_t>(cached_.size()))});
  } catch (const std::exception& e) {
    RELAY_LOG_DEBUG("Failed to Restore records", {StringField("context", name_)});
    RELAY_LOG_ERROR(e.what(), {StringField("context", name_)});
  }
}

void JsonRpcHistory::RegisterEventListeners() {
  auto on_record_event = [this](const char* event_name) {
    return [this, event_name](const JsonRpcRecord& record) {
      RELAY_LOG_INFO(std::string("Emitting ") + event_name, {StringField("context", name_)});
      RELAY_LOG_DEBUG("event", {StringField("context", name_), StringField("event", event_name), IntField("id", record.id()),
                                StringField("topic", record.topic())});
      Persist();
    };
  };

  events_.created.Connect(on_record_event("created"));
  events_.updated.Connect(on_record_event("updated"));
  events_.deleted.Connect(on_record_event("deleted"));
}

} // namespace relay::history
