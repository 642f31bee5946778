#include "informer.hpp"

namespace releasectl::cache {

bool WaitForCacheSync(runtime::StopSignal& stop, const std::vector<std::function<bool()>>& synced, std::chrono::milliseconds poll_interval) {
  while (true) {
    bool all_synced = true;
    for (const auto& fn : synced) {
      if (!fn()) {
        all_synced = false;
        break;
      }
    }
    if (all_synced) return true;

    if (stop.WaitFor(poll_interval)) return false;
  }
}

} // namespace releasectl::cache
