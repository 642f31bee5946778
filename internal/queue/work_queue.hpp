#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace releasectl::queue {

/*
  Thread-safe deduplicating queue of object keys.

  A key is in at most one of two places:
    dirty      - needs processing (queued, or re-added while processing)
    processing - handed out by Get() and not yet Done()

  Guarantees:
    - Add() of a key that is already dirty is a no-op.
    - Get() never hands the same key to two workers at once.
    - A key added while processing is queued again by Done().
*/
class WorkQueue {
 public:
  WorkQueue() = default;
  virtual ~WorkQueue() = default;

  WorkQueue(const WorkQueue&)            = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  void Add(const std::string& key);

  // Blocks until a key is available. std::nullopt once shut down.
  std::optional<std::string> Get();

  void Done(const std::string& key);

  std::size_t Len() const;

  // Wakes every blocked Get(); later Add() calls are ignored.
  virtual void ShutDown();
  bool         ShuttingDown() const;

 private:
  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::deque<std::string>         queue_;
  std::unordered_set<std::string> dirty_;
  std::unordered_set<std::string> processing_;
  bool                            shutting_down_ = false;
};

} // namespace releasectl::queue
