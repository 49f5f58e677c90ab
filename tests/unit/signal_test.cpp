#include "internal/event/signal.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using relay::event::Signal;

void TestHandlersRunInSubscriptionOrder() {
  Signal<std::string> signal;
  std::vector<std::string> seen;

  signal.Connect([&](const std::string& v) { seen.push_back("a:" + v); });
  signal.Connect([&](const std::string& v) { seen.push_back("b:" + v); });

  signal.Emit("x");

  assert(seen.size() == 2);
  assert(seen[0] == "a:x");
  assert(seen[1] == "b:x");
}

void TestOnceFiresSingleTime() {
  Signal<int> signal;
  int         calls = 0;

  signal.Once([&](const int&) { ++calls; });
  assert(signal.Size() == 1);

  signal.Emit(1);
  signal.Emit(2);

  assert(calls == 1);
  assert(signal.Size() == 0);
}

void TestDisconnectStopsDelivery() {
  Signal<> signal;
  int      calls = 0;

  const auto id = signal.Connect([&] { ++calls; });
  signal.Emit();
  assert(signal.Disconnect(id));
  assert(!signal.Disconnect(id));
  signal.Emit();

  assert(calls == 1);
}

void TestHandlerMayDisconnectItselfDuringEmit() {
  Signal<> signal;
  int      calls = 0;

  relay::event::SubscriptionId id = 0;
  id = signal.Connect([&] {
    ++calls;
    signal.Disconnect(id);
  });

  signal.Emit();
  signal.Emit();

  assert(calls == 1);
}

void TestMultiArgumentPayload() {
  Signal<std::string, int> signal;
  std::string              key;
  int                      value = 0;

  signal.Connect([&](const std::string& k, const int& v) {
    key   = k;
    value = v;
  });
  signal.Emit("answer", 42);

  assert(key == "answer");
  assert(value == 42);
}

} // namespace

int main() {
  TestHandlersRunInSubscriptionOrder();
  TestOnceFiresSingleTime();
  TestDisconnectStopsDelivery();
  TestHandlerMayDisconnectItselfDuringEmit();
  TestMultiArgumentPayload();

  std::cout << "relaycore_unit_signal: pass\n";
  return 0;
}
