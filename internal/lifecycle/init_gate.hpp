#pragma once

#include <future>
#include <mutex>
#include <string>

namespace relay::lifecycle {

/*
  Readiness gate shared by every persisted component.

    kUninitialized --BeginRestore--> kRestoring --MarkReady--> kReady

  Wait() returns at once when ready, blocks on a one-shot shared future
  while restoring, and throws util::NotInitialized when no restore was
  ever started. The readiness signal fires exactly once.
*/
class InitGate {
 public:
  enum class State { kUninitialized, kRestoring, kReady };

  explicit InitGate(std::string context);

  InitGate(const InitGate&)            = delete;
  InitGate& operator=(const InitGate&) = delete;

  // false if the gate already left kUninitialized
  bool BeginRestore();

  // false if the gate was already ready
  bool MarkReady();

  void Wait() const;

  State CurrentState() const;
  bool  IsReady() const;

 private:
  std::string context_;

  mutable std::mutex       mutex_;
  State                    state_ = State::kUninitialized;
  std::promise<void>       ready_;
  std::shared_future<void> ready_future_;
};

const char* ToString(InitGate::State state);

} // namespace relay::lifecycle
