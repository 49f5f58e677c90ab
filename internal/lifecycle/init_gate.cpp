#include "init_gate.hpp"

#include "internal/util/errors.hpp"

namespace relay::lifecycle {

InitGate::InitGate(std::string context) : context_(std::move(context)), ready_future_(ready_.get_future().share()) {
}

bool InitGate::BeginRestore() {
  std::lock_guard lock(mutex_);
  if (state_ != State::kUninitialized) return false;
  state_ = State::kRestoring;
  return true;
}

bool InitGate::MarkReady() {
  std::lock_guard lock(mutex_);
  if (state_ == State::kReady) return false;
  state_ = State::kReady;
  ready_.set_value();
  return true;
}

void InitGate::Wait() const {
  std::shared_future<void> ready;
  {
    std::lock_guard lock(mutex_);
    if (state_ == State::kReady) return;
    if (state_ == State::kUninitialized) {
      throw util::NotInitialized(context_);
    }
    ready = ready_future_;
  }
  ready.wait();
}

InitGate::State InitGate::CurrentState() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool InitGate::IsReady() const {
  return CurrentState() == State::kReady;
}

const char* ToString(InitGate::State state) {
  switch (state) {
    case InitGate::State::kUninitialized:
      return "uninitialized";
    case InitGate::State::kRestoring:
      return "restoring";
    case InitGate::State::kReady:
      return "ready";
  }
  return "unknown";
}

} // namespace relay::lifecycle
