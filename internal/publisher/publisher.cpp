#include "publisher.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/relay/relay_api.hpp"
#include "internal/util/hash.hpp"

namespace relay::publisher {

using observability::IntField;
using observability::StringField;
using relay::v1::PublishOptions;
using relay::v1::QueuedPublish;

Publisher::Publisher(transport::RelayTransportPtr transport, std::shared_ptr<heartbeat::Heartbeat> heartbeat, PublisherSettings settings)
    : transport_(std::move(transport)), heartbeat_(std::move(heartbeat)), settings_(std::move(settings)) {
  if (!transport_) throw std::invalid_argument("publisher requires a relay transport");
  if (!heartbeat_) throw std::invalid_argument("publisher requires a heartbeat");

  pulse_subscription_ = heartbeat_->Events().pulse.Connect([this] { CheckQueue(); });
}

Publisher::~Publisher() {
  heartbeat_->Events().pulse.Disconnect(pulse_subscription_);
}

void Publisher::Init() {
  // nothing is persisted for the queue; the gate opens immediately
  gate_.BeginRestore();
  if (gate_.MarkReady()) {
    RELAY_LOG_TRACE("Initialized", {StringField("context", name_)});
  }
}

void Publisher::Publish(const std::string& topic, const std::string& message, const PublishOptions& opts) {
  gate_.Wait();

  RELAY_LOG_DEBUG("Publishing Payload", {StringField("context", name_), StringField("topic", topic)});

  QueuedPublish params;
  params.set_topic(topic);
  params.set_message(message);
  *params.mutable_opts() = ResolveOptions(opts);

  const auto hash = util::HashMessage(message);
  {
    std::lock_guard lock(mutex_);
    queue_[hash] = params;
  }

  try {
    RpcPublish(params);
  } catch (const std::exception& e) {
    RELAY_LOG_DEBUG("Failed to Publish Payload", {StringField("context", name_), StringField("hash", hash)});
    RELAY_LOG_ERROR("Publish failed", {StringField("context", name_), StringField("topic", topic), StringField("error", e.what())});
    throw;
  }

  OnPublish(hash);
  RELAY_LOG_DEBUG("Successfully Published Payload", {StringField("context", name_), StringField("hash", hash)});
}

size_t Publisher::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::vector<QueuedPublish> Publisher::Queued() const {
  std::lock_guard lock(mutex_);

  std::vector<QueuedPublish> entries;
  entries.reserve(queue_.size());
  for (const auto& [hash, params] : queue_) entries.push_back(params);
  return entries;
}

// ------------------------------------------------------------
// Private
// ------------------------------------------------------------

PublishOptions Publisher::ResolveOptions(const PublishOptions& opts) const {
  PublishOptions resolved;
  resolved.set_ttl(opts.ttl() ? opts.ttl() : settings_.default_ttl);

  auto* relay_opts = resolved.mutable_relay();
  relay_opts->set_protocol(opts.has_relay() && !opts.relay().protocol().empty() ? opts.relay().protocol() : settings_.relay_protocol);
  if (opts.has_relay()) relay_opts->set_data(opts.relay().data());

  resolved.set_prompt(opts.has_prompt() ? opts.prompt() : false);
  return resolved;
}

void Publisher::RpcPublish(const QueuedPublish& params) {
  const auto& api = transport::GetRelayProtocolApi(transport::GetRelayProtocolName(params.opts()));

  relay::v1::RequestArguments request;
  request.set_method(api.publish);

  auto& fields = *request.mutable_params()->mutable_struct_value()->mutable_fields();
  fields["topic"].set_string_value(params.topic());
  fields["message"].set_string_value(params.message());
  fields["ttl"].set_number_value(static_cast<double>(params.opts().ttl()));
  // prompt is left out of the request entirely when unset
  if (params.opts().has_prompt()) {
    fields["prompt"].set_bool_value(params.opts().prompt());
  }

  RELAY_LOG_TRACE("Outgoing Relay Payload",
                  {StringField("context", name_), StringField("method", request.method()), StringField("topic", params.topic())});
  transport_->Request(request);
}

void Publisher::OnPublish(const std::string& hash) {
  QueuedPublish removed;
  {
    std::lock_guard lock(mutex_);
    auto            it = queue_.find(hash);
    if (it == queue_.end()) return;
    removed = std::move(it->second);
    queue_.erase(it);
  }
  events_.acknowledged.Emit(hash, removed);
}

void Publisher::CheckQueue() {
  std::vector<std::pair<std::string, QueuedPublish>> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.assign(queue_.begin(), queue_.end());
  }
  if (snapshot.empty()) return;

  RELAY_LOG_DEBUG("Resubmitting queued payloads", {StringField("context", name_), IntField("count", static_cast<int64_t>(snapshot.size()))});

  for (const auto& [hash, params] : snapshot) {
    // resubmissions carry ttl and relay only; prompt is a first-attempt flag
    QueuedPublish resend = params;
    resend.mutable_opts()->clear_prompt();
    try {
      RpcPublish(resend);
    } catch (const std::exception& e) {
      RELAY_LOG_WARN("Retry failed, keeping payload queued",
                     {StringField("context", name_), StringField("hash", hash), StringField("error", e.what())});
      continue;
    }
    OnPublish(hash);
  }
}

} // namespace relay::publisher
