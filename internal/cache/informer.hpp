#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/key.hpp"
#include "internal/runtime/stop_signal.hpp"
#include "releasectl/v1/release.pb.h"

namespace releasectl::cache {

/*
  Change notifications. Any member may be left empty.
*/
struct ResourceEventHandlerFuncs {
  std::function<void(const v1::Release&)>                             on_add;
  std::function<void(const v1::Release& old_obj, const v1::Release&)> on_update;
  std::function<void(const DeletedObject&)>                           on_delete;
};

/*
  Eventually-consistent local view of releases plus change notifications.
*/
class ReleaseInformer {
 public:
  virtual ~ReleaseInformer() = default;

  virtual void AddEventHandler(ResourceEventHandlerFuncs handler) = 0;

  // True once the initial list has been delivered to the cache.
  virtual bool HasSynced() const = 0;

  // Cached copy, std::nullopt if absent. Throws util::LookupError when the
  // cache cannot answer.
  virtual std::optional<v1::Release> Get(const std::string& release_namespace, const std::string& name) const = 0;

  virtual std::vector<v1::Release> List() const = 0;
};

/*
  Polls every synced function until all report true or stop fires.
  Returns false if stopped first.
*/
bool WaitForCacheSync(runtime::StopSignal& stop, const std::vector<std::function<bool()>>& synced,
                      std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

} // namespace releasectl::cache
