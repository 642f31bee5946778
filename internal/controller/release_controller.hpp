#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "internal/cache/informer.hpp"
#include "internal/controller/enqueue_handler.hpp"
#include "internal/queue/rate_limiting_queue.hpp"
#include "internal/release/release_manager.hpp"
#include "internal/runtime/stop_signal.hpp"

namespace releasectl::controller {

struct ControllerOptions {
  std::uint32_t             workers         = 1;
  std::chrono::milliseconds worker_period   = std::chrono::seconds(1);
  std::chrono::milliseconds cache_sync_poll = std::chrono::milliseconds(100);

  // Sweep again at the start of every worker cycle, not only at startup.
  bool periodic_sweep = false;
};

struct ControllerStats {
  std::uint64_t queue_depth       = 0;
  std::uint64_t waiting           = 0;
  std::uint32_t workers           = 0;
  bool          cache_synced      = false;
  std::uint64_t reconciles_ok     = 0;
  std::uint64_t reconciles_failed = 0;
  std::uint64_t requeues          = 0;
  std::uint64_t dropped_keys      = 0;
};

/*
  ReleaseController watches releases and hands every changed key to the
  release manager.

  Per key:
    malformed key           -> logged, dropped
    not in cache            -> manager.Delete
    in cache                -> manager.Trigger
    success                 -> Forget (backoff reset)
    lookup/manager failure  -> AddRateLimited (retried with backoff)

  The queue guarantees a key is never reconciled by two workers at once.
*/
class ReleaseController {
 public:
  ReleaseController(ControllerOptions options, std::shared_ptr<release::ReleaseManager> manager,
                    std::shared_ptr<cache::ReleaseInformer> informer, std::shared_ptr<queue::RateLimitingQueue> queue);

  ReleaseController(const ReleaseController&)            = delete;
  ReleaseController& operator=(const ReleaseController&) = delete;

  // Blocks until stop fires and in-flight reconciles have drained. Returns
  // early, without starting workers, if stop fires before the cache syncs.
  void Run(runtime::StopSignal& stop);

  // One dequeue/reconcile step. False when the queue is shut down or the
  // item failed, which ends the current worker cycle.
  bool ProcessNextWorkItem();

  ControllerStats Stats() const;

 private:
  void Worker();
  void Sweep();

  ControllerOptions                         options_;
  std::shared_ptr<release::ReleaseManager>  manager_;
  std::shared_ptr<cache::ReleaseInformer>   informer_;
  std::shared_ptr<queue::RateLimitingQueue> queue_;
  std::shared_ptr<EnqueueHandler>           handler_;

  std::atomic<std::uint32_t> running_workers_{0};
  std::atomic<std::uint64_t> reconciles_ok_{0};
  std::atomic<std::uint64_t> reconciles_failed_{0};
  std::atomic<std::uint64_t> requeues_{0};
  std::atomic<std::uint64_t> dropped_keys_{0};
};

} // namespace releasectl::controller
