#include "internal/history/json_rpc_history.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/storage/common/json_codec.hpp"
#include "internal/storage/memory/memory_key_value_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using relay::history::JsonRpcHistory;
using relay::storage::MemoryKeyValueStore;
using relay::v1::JsonRpcRecord;
using relay::v1::JsonRpcRecordList;
using relay::v1::JsonRpcRequest;
using relay::v1::JsonRpcResponse;

constexpr char kPrefix[] = "wc@2:client:";

JsonRpcRequest MakeRequest(int64_t id, const std::string& method) {
  JsonRpcRequest request;
  request.set_id(id);
  request.set_jsonrpc("2.0");
  request.set_method(method);
  (*request.mutable_params()->mutable_struct_value()->mutable_fields())["topic"].set_string_value("abc");
  return request;
}

JsonRpcResponse MakeResult(int64_t id, bool value) {
  JsonRpcResponse response;
  response.set_id(id);
  response.set_jsonrpc("2.0");
  response.mutable_result()->set_bool_value(value);
  return response;
}

JsonRpcResponse MakeError(int64_t id, int64_t code, const std::string& message) {
  JsonRpcResponse response;
  response.set_id(id);
  response.set_jsonrpc("2.0");
  response.mutable_error()->set_code(code);
  response.mutable_error()->set_message(message);
  return response;
}

/*
  Store whose reads block until released, to hold a component in the
  restoring state.
*/
class GatedStore final : public relay::storage::KeyValueStore {
 public:
  std::vector<std::string> GetKeys() override {
    return inner_.GetKeys();
  }

  std::optional<std::string> GetItem(const std::string& key) override {
    entered_.set_value();
    release_.get_future().wait();
    return inner_.GetItem(key);
  }

  void SetItem(const std::string& key, const std::string& value) override {
    inner_.SetItem(key, value);
  }

  void RemoveItem(const std::string& key) override {
    inner_.RemoveItem(key);
  }

  std::future<void> Entered() {
    return entered_.get_future();
  }

  void Release() {
    release_.set_value();
  }

 private:
  MemoryKeyValueStore inner_;
  std::promise<void>  entered_;
  std::promise<void>  release_;
};

void TestOperationsBeforeInitThrow() {
  JsonRpcHistory history(std::make_shared<MemoryKeyValueStore>(), kPrefix);

  bool threw = false;
  try {
    history.Set("abc", MakeRequest(1, "irn_subscribe"));
  } catch (const relay::util::NotInitialized& e) {
    threw = std::string(e.what()) == "history was not initialized";
  }
  assert(threw);
  assert(history.Size() == 0);
}

void TestFirstWriteWins() {
  auto           store = std::make_shared<MemoryKeyValueStore>();
  JsonRpcHistory history(store, kPrefix);
  history.Init();

  int created = 0;
  int syncs   = 0;
  history.Events().created.Connect([&](const JsonRpcRecord&) { ++created; });
  history.Events().sync.Connect([&] { ++syncs; });

  history.Set("abc", MakeRequest(1, "irn_subscribe"), std::string("eip155:1"));
  history.Set("abc", MakeRequest(1, "irn_unsubscribe"));

  assert(created == 1);
  assert(syncs == 1);

  auto record = history.Get("abc", 1);
  assert(record.request().method() == "irn_subscribe");
  assert(record.has_chain_id());
  assert(record.chain_id() == "eip155:1");
  assert(!record.has_response());
}

void TestResolveIsWriteOnce() {
  JsonRpcHistory history(std::make_shared<MemoryKeyValueStore>(), kPrefix);
  history.Init();

  int updated = 0;
  history.Events().updated.Connect([&](const JsonRpcRecord&) { ++updated; });

  history.Set("abc", MakeRequest(7, "irn_publish"));
  history.Resolve(MakeError(7, -32000, "relay rejected"));
  history.Resolve(MakeResult(7, true));
  // unknown ids are ignored
  history.Resolve(MakeResult(99, true));

  assert(updated == 1);

  auto record = history.Get("abc", 7);
  assert(record.response().has_error());
  assert(record.response().error().code() == -32000);
  assert(record.response().error().message() == "relay rejected");
  assert(!history.Exists("abc", 99));
}

void TestLookupErrorsAndTopicIsolation() {
  JsonRpcHistory history(std::make_shared<MemoryKeyValueStore>(), kPrefix);
  history.Init();
  history.Set("abc", MakeRequest(1, "irn_subscribe"));

  assert(history.Exists("abc", 1));
  assert(!history.Exists("def", 1));

  bool mismatched = false;
  try {
    history.Get("def", 1);
  } catch (const relay::util::MismatchedTopic& e) {
    mismatched = std::string(e.what()) == "Mismatched topic for history with id: 1";
  }
  assert(mismatched);

  bool missing = false;
  try {
    history.Get("abc", 2);
  } catch (const relay::util::NoMatchingId& e) {
    missing = std::string(e.what()) == "No matching history with id: 2";
  }
  assert(missing);

  // the id is already taken under another topic
  history.Set("def", MakeRequest(1, "irn_subscribe"));
  assert(history.Size() == 1);
  assert(history.Get("abc", 1).topic() == "abc");
}

void TestDeleteByTopicAndById() {
  JsonRpcHistory history(std::make_shared<MemoryKeyValueStore>(), kPrefix);
  history.Init();

  history.Set("abc", MakeRequest(1, "irn_subscribe"));
  history.Set("abc", MakeRequest(2, "irn_publish"));
  history.Set("def", MakeRequest(3, "irn_subscribe"));

  std::vector<int64_t> deleted;
  history.Events().deleted.Connect([&](const JsonRpcRecord& r) { deleted.push_back(r.id()); });

  history.Delete("def", 1);
  assert(deleted.empty());
  assert(history.Size() == 3);

  history.Delete("abc", 2);
  assert(deleted.size() == 1 && deleted[0] == 2);

  history.Delete("abc");
  assert(deleted.size() == 2 && deleted[1] == 1);
  assert(history.Keys() == std::vector<int64_t>{3});

  history.Delete("nope");
  assert(deleted.size() == 2);
}

void TestPendingListsUnresolvedRequests() {
  JsonRpcHistory history(std::make_shared<MemoryKeyValueStore>(), kPrefix);
  history.Init();

  JsonRpcRequest without_params;
  without_params.set_id(2);
  without_params.set_method("irn_unsubscribe");

  history.Set("abc", MakeRequest(1, "irn_subscribe"), std::string("eip155:1"));
  history.Set("abc", without_params);
  history.Set("def", MakeRequest(3, "irn_publish"));
  history.Resolve(MakeResult(3, true));

  auto pending = history.Pending();
  assert(pending.size() == 2);

  assert(pending[0].topic() == "abc");
  assert(pending[0].request().id() == 1);
  assert(pending[0].request().jsonrpc() == "2.0");
  assert(pending[0].request().method() == "irn_subscribe");
  assert(pending[0].request().params().struct_value().fields().at("topic").string_value() == "abc");
  assert(pending[0].chain_id() == "eip155:1");

  assert(pending[1].request().id() == 2);
  assert(pending[1].request().params().kind_case() == google::protobuf::Value::kNullValue);
  assert(!pending[1].has_chain_id());
}

void TestRecordsSurviveRestart() {
  auto store = std::make_shared<MemoryKeyValueStore>();
  {
    JsonRpcHistory history(store, kPrefix);
    history.Init();
    history.Set("abc", MakeRequest(1, "irn_subscribe"));
    history.Set("abc", MakeRequest(2, "irn_publish"));
    history.Resolve(MakeResult(2, true));
  }

  auto json = store->GetItem("wc@2:client:0.3//history");
  assert(json.has_value());

  JsonRpcHistory restored(store, kPrefix);
  int            inits = 0;
  restored.Events().init.Connect([&] { ++inits; });
  restored.Init();
  restored.Init();

  assert(inits == 1);
  assert(restored.Size() == 2);
  assert(!restored.Get("abc", 1).has_response());
  assert(restored.Get("abc", 2).response().result().bool_value());
  assert(restored.Pending().size() == 1);
}

void TestRestoreDoesNotOverrideLiveRecords() {
  auto           store = std::make_shared<MemoryKeyValueStore>();
  JsonRpcHistory history(store, kPrefix);
  history.Init();
  history.Set("abc", MakeRequest(1, "irn_subscribe"));

  JsonRpcRecordList other;
  auto*             foreign = other.add_records();
  foreign->set_id(42);
  foreign->set_topic("zzz");
  foreign->mutable_request()->set_method("irn_subscribe");
  store->SetItem(history.StorageKey(), relay::storage::common::ToJson(other));

  history.Init();

  assert(history.Size() == 1);
  assert(history.Exists("abc", 1));
  assert(!history.Exists("zzz", 42));
}

void TestCorruptedBacklogStartsEmpty() {
  auto store = std::make_shared<MemoryKeyValueStore>();
  store->SetItem("wc@2:client:0.3//history", "{not json");

  JsonRpcHistory history(store, kPrefix);
  int            inits = 0;
  history.Events().init.Connect([&] { ++inits; });
  history.Init();

  assert(inits == 1);
  assert(history.Size() == 0);

  history.Set("abc", MakeRequest(1, "irn_subscribe"));
  assert(history.Exists("abc", 1));
}

void TestCallsWaitWhileRestoring() {
  auto           store = std::make_shared<GatedStore>();
  JsonRpcHistory history(store, kPrefix);

  auto        entered = store->Entered();
  std::thread init([&] { history.Init(); });
  entered.wait();
  assert(history.GateState() == relay::lifecycle::InitGate::State::kRestoring);

  std::thread writer([&] { history.Set("abc", MakeRequest(1, "irn_subscribe")); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(history.Size() == 0);

  store->Release();
  init.join();
  writer.join();

  assert(history.GateState() == relay::lifecycle::InitGate::State::kReady);
  assert(history.Exists("abc", 1));
}

} // namespace

int main() {
  TestOperationsBeforeInitThrow();
  TestFirstWriteWins();
  TestResolveIsWriteOnce();
  TestLookupErrorsAndTopicIsolation();
  TestDeleteByTopicAndById();
  TestPendingListsUnresolvedRequests();
  TestRecordsSurviveRestart();
  TestRestoreDoesNotOverrideLiveRecords();
  TestCorruptedBacklogStartsEmpty();
  TestCallsWaitWhileRestoring();

  std::cout << "relaycore_unit_json_rpc_history: pass\n";
  return 0;
}
