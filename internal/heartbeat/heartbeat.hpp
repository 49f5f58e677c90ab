#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "internal/event/signal.hpp"

namespace relay::heartbeat {

struct HeartbeatEvents {
  event::Signal<> pulse;
};

/*
  Recurring pulse generator.

  A background thread emits `pulse` every interval. Subscribers run on
  that thread, one after another. Pulse() emits once on the caller's
  thread and is what tests use instead of Start().
*/
class Heartbeat {
 public:
  explicit Heartbeat(std::chrono::milliseconds interval);
  ~Heartbeat();

  Heartbeat(const Heartbeat&)            = delete;
  Heartbeat& operator=(const Heartbeat&) = delete;

  void Start();
  void Stop();

  void Pulse();

  HeartbeatEvents& Events() {
    return events_;
  }

  std::chrono::milliseconds Interval() const {
    return interval_;
  }

  bool IsRunning() const {
    return running_;
  }

 private:
  void Run();

  std::chrono::milliseconds interval_;
  HeartbeatEvents           events_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace relay::heartbeat
