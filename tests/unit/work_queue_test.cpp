#include "internal/queue/work_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

using releasectl::queue::WorkQueue;

void TestAddOfDirtyKeyIsDeduplicated() {
  WorkQueue queue;
  queue.Add("a/r1");
  queue.Add("a/r1");
  queue.Add("a/r2");
  assert(queue.Len() == 2);

  auto first = queue.Get();
  assert(first.has_value() && *first == "a/r1");
  auto second = queue.Get();
  assert(second.has_value() && *second == "a/r2");
  assert(queue.Len() == 0);

  queue.Done(*first);
  queue.Done(*second);
  assert(queue.Len() == 0);
}

void TestReAddWhileProcessingIsQueuedAfterDone() {
  WorkQueue queue;
  queue.Add("a/r1");

  auto key = queue.Get();
  assert(key.has_value());

  // Re-added while a worker holds it: not handed out yet.
  queue.Add("a/r1");
  queue.Add("a/r1");
  assert(queue.Len() == 0);

  queue.Done(*key);
  assert(queue.Len() == 1);

  auto again = queue.Get();
  assert(again.has_value() && *again == "a/r1");
  queue.Done(*again);
  assert(queue.Len() == 0);
}

void TestKeyIsNeverProcessedConcurrently() {
  WorkQueue queue;

  std::atomic<int>  in_flight{0};
  std::atomic<bool> overlap{false};
  std::atomic<int>  processed{0};

  std::vector<std::thread> workers;
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([&] {
      while (auto key = queue.Get()) {
        if (in_flight.fetch_add(1) != 0) overlap = true;
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        in_flight.fetch_sub(1);
        ++processed;
        queue.Done(*key);
      }
    });
  }

  for (int i = 0; i < 200; ++i) {
    queue.Add("a/hot");
    if (i % 10 == 0) std::this_thread::sleep_for(std::chrono::microseconds(100));
  }

  // Let the last re-add drain before shutting down.
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (queue.Len() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(10));

  queue.ShutDown();
  for (auto& worker : workers) worker.join();

  assert(!overlap);
  assert(processed >= 1);
}

void TestShutDownWakesBlockedGetAndIgnoresAdds() {
  WorkQueue queue;

  std::atomic<bool> returned_empty{false};
  std::thread       waiter([&] {
    auto key       = queue.Get();
    returned_empty = !key.has_value();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.ShutDown();
  waiter.join();

  assert(returned_empty);
  assert(queue.ShuttingDown());

  queue.Add("a/late");
  assert(queue.Len() == 0);
  assert(!queue.Get().has_value());
}

} // namespace

int main() {
  TestAddOfDirtyKeyIsDeduplicated();
  TestReAddWhileProcessingIsQueuedAfterDone();
  TestKeyIsNeverProcessedConcurrently();
  TestShutDownWakesBlockedGetAndIgnoresAdds();

  std::cout << "releasectl_unit_work_queue: pass\n";
  return 0;
}
