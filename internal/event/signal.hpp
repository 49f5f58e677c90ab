#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace relay::event {

using SubscriptionId = uint64_t;

/*
  Typed publish/subscribe signal.

  Handlers run on the emitting thread, in subscription order. The handler
  list is copied before dispatch so handlers may connect, disconnect or
  emit on the same signal. Once-handlers are removed before they run and
  therefore fire at most one time even under concurrent Emit.
*/
template <typename... Args>
class Signal {
 public:
  using Handler = std::function<void(const Args&...)>;

  Signal()                         = default;
  Signal(const Signal&)            = delete;
  Signal& operator=(const Signal&) = delete;

  SubscriptionId Connect(Handler handler) {
    return Add(std::move(handler), false);
  }

  SubscriptionId Once(Handler handler) {
    return Add(std::move(handler), true);
  }

  bool Disconnect(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    for (auto it = slots_.begin(); it != slots_.end(); ++it) {
      if (it->id == id) {
        slots_.erase(it);
        return true;
      }
    }
    return false;
  }

  void Emit(const Args&... args) {
    std::vector<Handler> handlers;
    {
      std::lock_guard lock(mutex_);
      handlers.reserve(slots_.size());
      for (auto it = slots_.begin(); it != slots_.end();) {
        handlers.push_back(it->handler);
        if (it->once) {
          it = slots_.erase(it);
        } else {
          ++it;
        }
      }
    }

    for (const auto& handler : handlers) {
      handler(args...);
    }
  }

  size_t Size() const {
    std::lock_guard lock(mutex_);
    return slots_.size();
  }

 private:
  struct Slot {
    SubscriptionId id;
    Handler        handler;
    bool           once;
  };

  SubscriptionId Add(Handler handler, bool once) {
    std::lock_guard lock(mutex_);
    const auto      id = next_id_++;
    slots_.push_back(Slot{id, std::move(handler), once});
    return id;
  }

  mutable std::mutex mutex_;
  std::vector<Slot>  slots_;
  SubscriptionId     next_id_ = 1;
};

} // namespace relay::event
