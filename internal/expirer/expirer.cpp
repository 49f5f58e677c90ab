#include "expirer.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/json_codec.hpp"
#include "internal/util/errors.hpp"

namespace relay::expirer {

using observability::IntField;
using observability::StringField;
using relay::v1::Expiration;
using relay::v1::ExpirationList;

Expirer::Expirer(storage::KeyValueStorePtr store, std::shared_ptr<heartbeat::Heartbeat> heartbeat, std::string storage_prefix,
                 util::NowFn now)
    : storage_prefix_(std::move(storage_prefix)), store_(std::move(store)), heartbeat_(std::move(heartbeat)), now_(std::move(now)) {
  if (!store_) throw std::invalid_argument("expirer requires a key-value store");
  if (!heartbeat_) throw std::invalid_argument("expirer requires a heartbeat");
  if (!now_) throw std::invalid_argument("expirer requires a clock");
}

Expirer::~Expirer() {
  if (pulse_subscription_) heartbeat_->Events().pulse.Disconnect(*pulse_subscription_);
}

std::string Expirer::StorageKey() const {
  return storage::MakeStorageKey(storage_prefix_, version_, name_);
}

void Expirer::Init() {
  const bool first = gate_.BeginRestore();
  RELAY_LOG_TRACE("Initialized", {StringField("context", name_)});

  Restore();

  {
    std::lock_guard lock(mutex_);
    for (auto& expiration : cached_) {
      const auto topic = expiration.topic();
      expirations_.emplace(topic, std::move(expiration));
    }
    cached_.clear();
  }

  if (first) RegisterEventListeners();

  if (gate_.MarkReady()) {
    events_.init.Emit();
  }
}

// ------------------------------------------------------------
// Public
// ------------------------------------------------------------

bool Expirer::Has(const std::string& topic) {
  if (gate_.CurrentState() != lifecycle::InitGate::State::kUninitialized) gate_.Wait();
  return FindExpiration(topic).has_value();
}

void Expirer::Set(const std::string& topic, const Expiration& expiration) {
  gate_.Wait();

  Expiration entry = expiration;
  entry.set_topic(topic);
  {
    std::lock_guard lock(mutex_);
    expirations_[topic] = entry;
  }

  CheckExpiry(topic, entry);
  events_.created.Emit(ExpirerEvent{topic, entry});
}

Expiration Expirer::Get(const std::string& topic) {
  gate_.Wait();
  return GetExpiration(topic);
}

void Expirer::Del(const std::string& topic) {
  gate_.Wait();

  std::optional<Expiration> removed;
  {
    std::lock_guard lock(mutex_);
    auto            it = expirations_.find(topic);
    if (it == expirations_.end()) return;
    removed = std::move(it->second);
    expirations_.erase(it);
  }

  events_.deleted.Emit(ExpirerEvent{topic, *removed});
}

size_t Expirer::Length() const {
  std::lock_guard lock(mutex_);
  return expirations_.size();
}

std::vector<std::string> Expirer::Topics() const {
  std::lock_guard lock(mutex_);

  std::vector<std::string> topics;
  topics.reserve(expirations_.size());
  for (const auto& [topic, expiration] : expirations_) topics.push_back(topic);
  return topics;
}

std::vector<Expiration> Expirer::Values() const {
  std::lock_guard lock(mutex_);

  std::vector<Expiration> values;
  values.reserve(expirations_.size());
  for (const auto& [topic, expiration] : expirations_) values.push_back(expiration);
  return values;
}

// ------------------------------------------------------------
// Private
// ------------------------------------------------------------

std::optional<Expiration> Expirer::FindExpiration(const std::string& topic) const {
  std::lock_guard lock(mutex_);

  auto it = expirations_.find(topic);
  if (it == expirations_.end()) return std::nullopt;
  return it->second;
}

Expiration Expirer::GetExpiration(const std::string& topic) const {
  auto expiration = FindExpiration(topic);
  if (!expiration) {
    throw util::NoMatchingId("No matching " + name_ + " with topic: " + topic);
  }
  return *expiration;
}

bool Expirer::IsExpired(const Expiration& expiration) const {
  // compare in seconds so any int64 expiry stays in range
  return expiration.expiry() <= util::ToUnixSeconds(now_());
}

void Expirer::CheckExpiry(const std::string& topic, const Expiration& expiration) {
  if (IsExpired(expiration)) Expire(topic, expiration);
}

void Expirer::Expire(const std::string& topic, const Expiration& expiration) {
  {
    std::lock_guard lock(mutex_);
    auto            it = expirations_.find(topic);
    // the entry may have been removed or re-set since it was checked
    if (it == expirations_.end() || it->second.expiry() != expiration.expiry()) return;
    expirations_.erase(it);
  }

  events_.expired.Emit(ExpirerEvent{topic, expiration});
}

void Expirer::CheckExpirations() {
  for (const auto& expiration : Values()) {
    CheckExpiry(expiration.topic(), expiration);
  }
}

std::optional<std::vector<Expiration>> Expirer::GetExpirations() {
  auto json = store_->GetItem(StorageKey());
  if (!json) return std::nullopt;

  auto list = storage::common::FromJson<ExpirationList>(*json);
  return std::vector<Expiration>(list.expirations().begin(), list.expirations().end());
}

void Expirer::Persist() {
  try {
    std::lock_guard persist_lock(persist_mutex_);

    ExpirationList list;
    for (auto& expiration : Values()) *list.add_expirations() = std::move(expiration);

    store_->SetItem(StorageKey(), storage::common::ToJson(list));
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("Failed to persist expirations", {StringField("context", name_), StringField("error", e.what())});
    return;
  }

  events_.sync.Emit();
}

void Expirer::Restore() {
  try {
    auto persisted = GetExpirations();
    if (!persisted || persisted->empty()) return;

    std::lock_guard lock(mutex_);
    if (!expirations_.empty()) {
      throw util::RestoreWillOverride(name_);
    }
    cached_ = std::move(*persisted);

    RELAY_LOG_DEBUG("Successfully Restored expirations",
                    {StringField("context", name_), IntField("count", static_cast<int64_t>(cached_.size()))});
  } catch (const std::exception& e) {
    RELAY_LOG_DEBUG("Failed to Restore expirations", {StringField("context", name_)});
    RELAY_LOG_ERROR(e.what(), {StringField("context", name_)});
  }
}

void Expirer::RegisterEventListeners() {
  pulse_subscription_ = heartbeat_->Events().pulse.Connect([this] { CheckExpirations(); });

  auto on_expiration_event = [this](const char* event_name) {
    return [this, event_name](const ExpirerEvent& event) {
      RELAY_LOG_INFO(std::string("Emitting ") + event_name, {StringField("context", name_)});
      RELAY_LOG_DEBUG("event", {StringField("context", name_), StringField("event", event_name), StringField("topic", event.topic),
                                IntField("expiry", event.expiration.expiry())});
      Persist();
    };
  };

  events_.created.Connect(on_expiration_event("created"));
  events_.expired.Connect(on_expiration_event("expired"));
  events_.deleted.Connect(on_expiration_event("deleted"));
}

} // namespace relay::expirer
