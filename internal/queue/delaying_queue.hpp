#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "work_queue.hpp"

namespace releasectl::queue {

/*
  WorkQueue with deferred adds.

  A single waiter thread holds delayed keys in a min-heap keyed by ready
  time and moves them into the queue once due. Delaying a key that is
  already waiting keeps the earlier ready time.
*/
class DelayingQueue : public WorkQueue {
 public:
  using SteadyClock = std::chrono::steady_clock;

  DelayingQueue();
  ~DelayingQueue() override;

  void AddAfter(const std::string& key, SteadyClock::duration delay);

  // Number of keys waiting for their delay to elapse.
  std::size_t Waiting() const;

  void ShutDown() override;

 private:
  struct Entry {
    SteadyClock::time_point ready_at;
    std::uint64_t           seq = 0;
    std::string             key;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.ready_at != b.ready_at) return a.ready_at > b.ready_at;
      return a.seq > b.seq;
    }
  };

  void WaitLoop();

  mutable std::mutex                                     waiting_mutex_;
  std::condition_variable                                waiting_cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later>  heap_;
  std::unordered_map<std::string, SteadyClock::time_point> ready_at_;
  std::uint64_t                                          next_seq_ = 0;
  bool                                                   stopping_ = false;

  std::thread waiter_;
};

} // namespace releasectl::queue
