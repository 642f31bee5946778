#include "internal/queue/delaying_queue.hpp"
#include "internal/queue/rate_limiter.hpp"
#include "internal/queue/rate_limiting_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace {

using namespace std::chrono_literals;
using releasectl::queue::DelayingQueue;
using releasectl::queue::ItemExponentialFailureRateLimiter;
using releasectl::queue::RateLimitingQueue;

bool WaitForLen(const DelayingQueue& queue, std::size_t len, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (queue.Len() == len) return true;
    std::this_thread::sleep_for(1ms);
  }
  return queue.Len() == len;
}

void TestNonPositiveDelayAddsImmediately() {
  DelayingQueue queue;
  queue.AddAfter("a/now", 0ms);
  assert(queue.Len() == 1);
  assert(queue.Waiting() == 0);
}

void TestDelayedKeysBecomeReadyInDueOrder() {
  DelayingQueue queue;
  queue.AddAfter("a/later", 80ms);
  queue.AddAfter("a/sooner", 20ms);
  assert(queue.Len() == 0);
  assert(queue.Waiting() == 2);

  assert(WaitForLen(queue, 2, 2000ms));
  assert(queue.Waiting() == 0);

  auto first = queue.Get();
  assert(first.has_value() && *first == "a/sooner");
  auto second = queue.Get();
  assert(second.has_value() && *second == "a/later");
}

void TestEarlierReadyTimeWins() {
  DelayingQueue queue;
  queue.AddAfter("a/r1", 10s);
  queue.AddAfter("a/r1", 10ms);
  assert(queue.Waiting() == 1);

  assert(WaitForLen(queue, 1, 2000ms));
}

void TestShutDownDropsWaitingKeys() {
  DelayingQueue queue;
  queue.AddAfter("a/r1", 10s);
  queue.ShutDown();
  assert(queue.ShuttingDown());
  assert(queue.Len() == 0);
  assert(!queue.Get().has_value());
}

void TestAddRateLimitedRequeuesWithBackoffAndForgetResets() {
  auto limiter = std::make_shared<ItemExponentialFailureRateLimiter>(std::chrono::milliseconds(5), std::chrono::seconds(1));
  RateLimitingQueue queue(limiter);

  queue.AddRateLimited("a/r1");
  assert(queue.NumRequeues("a/r1") == 1);
  assert(WaitForLen(queue, 1, 2000ms));

  auto key = queue.Get();
  assert(key.has_value());
  queue.AddRateLimited(*key);
  queue.Done(*key);
  assert(queue.NumRequeues("a/r1") == 2);

  queue.Forget("a/r1");
  assert(queue.NumRequeues("a/r1") == 0);
}

} // namespace

int main() {
  TestNonPositiveDelayAddsImmediately();
  TestDelayedKeysBecomeReadyInDueOrder();
  TestEarlierReadyTimeWins();
  TestShutDownDropsWaitingKeys();
  TestAddRateLimitedRequeuesWithBackoffAndForgetResets();

  std::cout << "releasectl_unit_delaying_queue: pass\n";
  return 0;
}
