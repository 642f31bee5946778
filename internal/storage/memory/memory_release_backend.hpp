#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/storage/release_backend.hpp"

namespace releasectl::storage::memory {

class MemoryReleaseBackend final : public ReleaseBackend {
 public:
  MemoryReleaseBackend();

  std::optional<v1::Release> GetRelease(const std::string& release_namespace, const std::string& name) override;
  std::vector<v1::Release>   ListReleases(const std::string& release_namespace) override;
  v1::Release                CreateRelease(const v1::Release& release) override;
  v1::Release                UpdateRelease(const v1::Release& release) override;
  v1::Release UpdateReleaseStatus(const std::string& release_namespace, const std::string& name, const v1::ReleaseStatus& status) override;
  void        DeleteRelease(const std::string& release_namespace, const std::string& name) override;

  void                            CreateHistory(const v1::ReleaseHistory& history) override;
  std::vector<v1::ReleaseHistory> ListHistories(const std::string& release_namespace, const std::string& name) override;
  std::vector<v1::ReleaseHistory> ListAllHistories() override;
  void                            DeleteHistories(const std::string& release_namespace, const std::string& name) override;

  ListWatchResult ListAndWatch(WatchHandler handler) override;
  void            StopWatch(std::uint64_t watch_id) override;

 private:
  using ObjectKey = std::pair<std::string, std::string>;

  // Releases `lock` before running the handlers.
  void Notify(std::unique_lock<std::mutex>& lock, EventType type, const v1::Release& release);

  // Held by writers through dispatch so events reach watchers in write order.
  std::mutex dispatch_mutex_;
  std::mutex mutex_;

  // Ordered so listings are stable.
  std::map<ObjectKey, v1::Release>                           releases_;
  std::map<ObjectKey, std::map<int32_t, v1::ReleaseHistory>> histories_;

  std::unordered_map<std::uint64_t, WatchHandler> watchers_;
  std::uint64_t                                   next_watch_id_    = 1;
  std::uint64_t                                   resource_version_ = 0;
};

} // namespace releasectl::storage::memory
