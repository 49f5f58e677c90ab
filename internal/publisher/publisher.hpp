#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/event/signal.hpp"
#include "internal/heartbeat/heartbeat.hpp"
#include "internal/lifecycle/init_gate.hpp"
#include "internal/relay/relay_transport.hpp"
#include "relay/v1.hpp"

namespace relay::publisher {

inline constexpr char     kPublisherContext[]  = "publisher";
inline constexpr uint64_t kPublisherDefaultTtl = 86400;

struct PublisherSettings {
  uint64_t    default_ttl    = kPublisherDefaultTtl;
  std::string relay_protocol = "irn";
};

struct PublisherEvents {
  // fingerprint, entry; fired once when an entry leaves the queue
  event::Signal<std::string, relay::v1::QueuedPublish> acknowledged;
};

/*
  Outbound delivery with automatic resubmission.

  Publish() queues the message under its fingerprint before the first
  transport call and only dequeues it on acknowledgement. A failed call
  is rethrown to the caller while the entry stays queued; every heartbeat
  pulse resubmits whatever is still queued, forever, with no backoff.
  The effective retry interval is therefore the heartbeat interval.
  Resubmissions send topic, message, ttl and relay; prompt is only sent
  on the first attempt.

  Pulses arrive on the heartbeat thread; stop the heartbeat before
  destroying a Publisher.
*/
class Publisher {
 public:
  Publisher(transport::RelayTransportPtr transport, std::shared_ptr<heartbeat::Heartbeat> heartbeat, PublisherSettings settings = {});
  ~Publisher();

  Publisher(const Publisher&)            = delete;
  Publisher& operator=(const Publisher&) = delete;

  void Init();

  void Publish(const std::string& topic, const std::string& message, const relay::v1::PublishOptions& opts = {});

  size_t                                Size() const;
  std::vector<relay::v1::QueuedPublish> Queued() const;

  PublisherEvents& Events() {
    return events_;
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  relay::v1::PublishOptions ResolveOptions(const relay::v1::PublishOptions& opts) const;

  void RpcPublish(const relay::v1::QueuedPublish& params);
  void OnPublish(const std::string& hash);
  void CheckQueue();

  std::string                           name_ = kPublisherContext;
  transport::RelayTransportPtr          transport_;
  std::shared_ptr<heartbeat::Heartbeat> heartbeat_;
  PublisherSettings                     settings_;
  event::SubscriptionId                 pulse_subscription_ = 0;

  lifecycle::InitGate gate_{kPublisherContext};
  PublisherEvents     events_;

  mutable std::mutex                                        mutex_;
  std::unordered_map<std::string, relay::v1::QueuedPublish> queue_;
};

} // namespace relay::publisher
