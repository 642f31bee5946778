#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "internal/cache/informer.hpp"
#include "internal/queue/rate_limiting_queue.hpp"

namespace releasectl::controller {

/*
  Change notifier: turns informer events into queue keys.

  Adds, updates and deletes (tombstones included) all enqueue the object's
  key; the worker decides what to do from current cache state. Objects
  without a valid key are logged and dropped. After Stop() every event is
  dropped.
*/
class EnqueueHandler : public std::enable_shared_from_this<EnqueueHandler> {
 public:
  explicit EnqueueHandler(std::shared_ptr<queue::RateLimitingQueue> queue);

  void OnAdd(const v1::Release& obj);
  void OnUpdate(const v1::Release& old_obj, const v1::Release& new_obj);
  void OnDelete(const cache::DeletedObject& obj);

  void Stop();

  std::uint64_t Dropped() const;

  // Handler funcs that keep this adapter alive for as long as the informer
  // holds them.
  cache::ResourceEventHandlerFuncs Funcs();

 private:
  void Enqueue(const cache::DeletedObject& obj);

  std::shared_ptr<queue::RateLimitingQueue> queue_;
  std::atomic<bool>                         stopped_{false};
  std::atomic<std::uint64_t>                dropped_{0};
};

} // namespace releasectl::controller
