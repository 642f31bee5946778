#include "release_controller.hpp"

#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/cache/key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace releasectl::controller {

using observability::IntField;
using observability::StringField;

namespace {

// Marks the key done on every exit path of a work item.
class DoneGuard {
 public:
  DoneGuard(queue::RateLimitingQueue& queue, std::string key) : queue_(queue), key_(std::move(key)) {
  }
  ~DoneGuard() {
    queue_.Done(key_);
  }

  DoneGuard(const DoneGuard&)            = delete;
  DoneGuard& operator=(const DoneGuard&) = delete;

 private:
  queue::RateLimitingQueue& queue_;
  std::string               key_;
};

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace

ReleaseController::ReleaseController(ControllerOptions options, std::shared_ptr<release::ReleaseManager> manager,
                                     std::shared_ptr<cache::ReleaseInformer> informer, std::shared_ptr<queue::RateLimitingQueue> queue)
    : options_(options),
      manager_(std::move(manager)),
      informer_(std::move(informer)),
      queue_(std::move(queue)),
      handler_(std::make_shared<EnqueueHandler>(queue_)) {
  if (options_.workers == 0) options_.workers = 1;
  informer_->AddEventHandler(handler_->Funcs());
}

void ReleaseController::Run(runtime::StopSignal& stop) {
  RELEASECTL_LOG_INFO("Running ReleaseController", {IntField("workers", options_.workers)});

  if (!cache::WaitForCacheSync(stop, {[this] { return informer_->HasSynced(); }}, options_.cache_sync_poll)) {
    RELEASECTL_LOG_ERROR("Can't sync cache");
    handler_->Stop();
    queue_->ShutDown();
    return;
  }
  RELEASECTL_LOG_INFO("Sync ReleaseController cache successfully");

  // Repair leftovers of an unclean shutdown before new work interleaves.
  Sweep();

  std::vector<std::thread> workers;
  workers.reserve(options_.workers);
  for (std::uint32_t i = 0; i < options_.workers; ++i) {
    workers.emplace_back([this, &stop] { runtime::Until([this] { Worker(); }, options_.worker_period, stop); });
  }
  running_workers_ = options_.workers;

  stop.Wait();
  RELEASECTL_LOG_INFO("Shutting down ReleaseController");

  handler_->Stop();
  queue_->ShutDown();
  for (auto& worker : workers) worker.join();
  running_workers_ = 0;

  RELEASECTL_LOG_INFO("ReleaseController stopped");
}

void ReleaseController::Worker() {
  if (options_.periodic_sweep) Sweep();

  RELEASECTL_LOG_DEBUG("Processing ReleaseController releases");
  while (ProcessNextWorkItem()) {
  }
}

void ReleaseController::Sweep() {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    manager_->Run();
    observability::Metrics::Instance().RecordReconcile("sweep", true);
  } catch (const std::exception& e) {
    observability::Metrics::Instance().RecordReconcile("sweep", false);
    RELEASECTL_LOG_ERROR("Can't run manager", {StringField("error", e.what())});
  }
  observability::Metrics::Instance().ObserveReconcileDurationMs("sweep", ElapsedMs(started_at));
}

bool ReleaseController::ProcessNextWorkItem() {
  auto key = queue_->Get();
  if (!key) {
    RELEASECTL_LOG_DEBUG("Release queue is shutting down");
    return false;
  }
  DoneGuard done(*queue_, *key);
  observability::Metrics::Instance().SetQueueDepth(queue_->Len());

  std::pair<std::string, std::string> parts;
  try {
    parts = cache::SplitMetaNamespaceKey(*key);
  } catch (const util::KeyDecodeError& e) {
    ++dropped_keys_;
    RELEASECTL_LOG_ERROR("Can't recognize key of release", {StringField("key", *key), StringField("error", e.what())});
    return false;
  }
  const auto& [release_namespace, name] = parts;

  RELEASECTL_LOG_DEBUG("Handle release by key", {StringField("key", *key)});

  observability::SpanScope span("ReleaseController.Reconcile");
  span.SetAttribute("key", *key);

  const auto  started_at = std::chrono::steady_clock::now();
  std::string action     = "lookup";
  try {
    auto release = informer_->Get(release_namespace, name);
    if (!release) {
      // Deleted
      action = "delete";
      manager_->Delete(release_namespace, name);
    } else {
      // Added or updated
      action = "trigger";
      manager_->Trigger(*release);
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    queue_->AddRateLimited(*key);
    ++reconciles_failed_;
    ++requeues_;

    observability::Metrics::Instance().RecordReconcile(action, false);
    observability::Metrics::Instance().RecordRequeue();
    observability::Metrics::Instance().ObserveReconcileDurationMs(action, ElapsedMs(started_at));
    RELEASECTL_LOG_ERROR("Can't handle release", {StringField("key", *key), StringField("action", action), StringField("error", e.what()),
                                                  IntField("requeues", queue_->NumRequeues(*key))});
    return false;
  }

  queue_->Forget(*key);
  ++reconciles_ok_;

  observability::Metrics::Instance().RecordReconcile(action, true);
  observability::Metrics::Instance().ObserveReconcileDurationMs(action, ElapsedMs(started_at));
  RELEASECTL_LOG_DEBUG("Handled release", {StringField("key", *key), StringField("action", action)});
  return true;
}

ControllerStats ReleaseController::Stats() const {
  ControllerStats stats;
  stats.queue_depth       = queue_->Len();
  stats.waiting           = queue_->Waiting();
  stats.workers           = running_workers_;
  stats.cache_synced      = informer_->HasSynced();
  stats.reconciles_ok     = reconciles_ok_;
  stats.reconciles_failed = reconciles_failed_;
  stats.requeues          = requeues_;
  stats.dropped_keys      = dropped_keys_ + handler_->Dropped();
  return stats;
}

} // namespace releasectl::controller
