#include "heartbeat.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace relay::heartbeat {

using observability::IntField;
using observability::StringField;

Heartbeat::Heartbeat(std::chrono::milliseconds interval) : interval_(interval) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("heartbeat interval must be positive");
  }
}

Heartbeat::~Heartbeat() {
  Stop();
}

void Heartbeat::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&Heartbeat::Run, this);
  RELAY_LOG_DEBUG("Heartbeat started", {IntField("interval_ms", interval_.count())});
}

void Heartbeat::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_.exchange(false)) return;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  RELAY_LOG_DEBUG("Heartbeat stopped");
}

void Heartbeat::Pulse() {
  RELAY_LOG_TRACE("Heartbeat pulse", {IntField("subscribers", static_cast<int64_t>(events_.pulse.Size()))});
  events_.pulse.Emit();
}

void Heartbeat::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [&] { return !running_; })) break;

    lock.unlock();
    try {
      Pulse();
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("Pulse handler failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace relay::heartbeat
