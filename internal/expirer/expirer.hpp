#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/event/signal.hpp"
#include "internal/heartbeat/heartbeat.hpp"
#include "internal/lifecycle/init_gate.hpp"
#include "internal/storage/key_value_store.hpp"
#include "internal/util/time.hpp"
#include "relay/v1.hpp"

namespace relay::expirer {

inline constexpr char kExpirerContext[]        = "expirer";
inline constexpr char kExpirerStorageVersion[] = "0.3";

struct ExpirerEvent {
  std::string           topic;
  relay::v1::Expiration expiration;
};

struct ExpirerEvents {
  event::Signal<ExpirerEvent> created;
  // explicit removal through Del()
  event::Signal<ExpirerEvent> deleted;
  // passive timeout, from Set() or a pulse sweep
  event::Signal<ExpirerEvent> expired;
  event::Signal<>             sync;
  event::Signal<>             init;
};

/*
  TTL-driven garbage collector for topics.

  An entry is checked against the clock when it is set and on every
  heartbeat pulse; once its expiry has passed it is removed and `expired`
  is emitted. Every created/deleted/expired event rewrites the full
  index to storage under <prefix>0.3//expirer.

  Sweeps run on the heartbeat thread; stop the heartbeat before
  destroying an Expirer.
*/
class Expirer {
 public:
  Expirer(storage::KeyValueStorePtr store, std::shared_ptr<heartbeat::Heartbeat> heartbeat, std::string storage_prefix,
          util::NowFn now = util::Now);
  ~Expirer();

  Expirer(const Expirer&)            = delete;
  Expirer& operator=(const Expirer&) = delete;

  // Restores persisted entries, starts listening for pulses and opens the
  // gate. Calling it again only re-runs restore.
  void Init();

  // Never throws.
  bool Has(const std::string& topic);

  void Set(const std::string& topic, const relay::v1::Expiration& expiration);

  // Throws util::NoMatchingId.
  relay::v1::Expiration Get(const std::string& topic);

  void Del(const std::string& topic);

  size_t                             Length() const;
  std::vector<std::string>           Topics() const;
  std::vector<relay::v1::Expiration> Values() const;

  ExpirerEvents& Events() {
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
  std::optional<relay::v1::Expiration> FindExpiration(const std::string& topic) const;
  relay::v1::Expiration                GetExpiration(const std::string& topic) const;

  bool IsExpired(const relay::v1::Expiration& expiration) const;
  void CheckExpiry(const std::string& topic, const relay::v1::Expiration& expiration);
  void Expire(const std::string& topic, const relay::v1::Expiration& expiration);
  void CheckExpirations();

  std::optional<std::vector<relay::v1::Expiration>> GetExpirations();

  void Persist();
  void Restore();
  void RegisterEventListeners();

  std::string                           name_    = kExpirerContext;
  std::string                           version_ = kExpirerStorageVersion;
  std::string                           storage_prefix_;
  storage::KeyValueStorePtr             store_;
  std::shared_ptr<heartbeat::Heartbeat> heartbeat_;
  util::NowFn                           now_;
  std::optional<event::SubscriptionId>  pulse_subscription_;

  lifecycle::InitGate gate_{kExpirerContext};
  ExpirerEvents       events_;

  mutable std::mutex                           mutex_;
  std::map<std::string, relay::v1::Expiration> expirations_;
  std::vector<relay::v1::Expiration>           cached_;

  std::mutex persist_mutex_;
};

} // namespace relay::expirer
