#include "memory_release_backend.hpp"

#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace releasectl::storage::memory {

namespace {

std::string Describe(const std::string& release_namespace, const std::string& name) {
  return release_namespace.empty() ? name : release_namespace + "/" + name;
}

} // namespace

MemoryReleaseBackend::MemoryReleaseBackend() = default;

void MemoryReleaseBackend::Notify(std::unique_lock<std::mutex>& lock, EventType type, const v1::Release& release) {
  WatchEvent                event{type, release};
  std::vector<WatchHandler> handlers;
  handlers.reserve(watchers_.size());
  for (const auto& [_, handler] : watchers_) handlers.push_back(handler);
  lock.unlock();

  for (const auto& handler : handlers) {
    handler(event);
  }
}

std::optional<v1::Release> MemoryReleaseBackend::GetRelease(const std::string& release_namespace, const std::string& name) {
  std::lock_guard lock(mutex_);
  auto it = releases_.find({release_namespace, name});
  if (it == releases_.end()) return std::nullopt;
  return it->second;
}

std::vector<v1::Release> MemoryReleaseBackend::ListReleases(const std::string& release_namespace) {
  std::lock_guard          lock(mutex_);
  std::vector<v1::Release> out;
  for (const auto& [key, release] : releases_) {
    if (release_namespace.empty() || key.first == release_namespace) out.push_back(release);
  }
  return out;
}

v1::Release MemoryReleaseBackend::CreateRelease(const v1::Release& release) {
  std::lock_guard  dispatch(dispatch_mutex_);
  std::unique_lock lock(mutex_);

  const ObjectKey key{release.namespace_(), release.name()};
  if (releases_.contains(key)) {
    throw util::AlreadyExists("release already exists: " + Describe(key.first, key.second));
  }

  v1::Release stored = release;
  stored.set_resource_version(++resource_version_);
  releases_[key] = stored;

  Notify(lock, EventType::kAdded, stored);
  return stored;
}

v1::Release MemoryReleaseBackend::UpdateRelease(const v1::Release& release) {
  std::lock_guard  dispatch(dispatch_mutex_);
  std::unique_lock lock(mutex_);

  auto it = releases_.find({release.namespace_(), release.name()});
  if (it == releases_.end()) {
    throw util::NotFound("release not found: " + Describe(release.namespace_(), release.name()));
  }
  if (release.resource_version() != 0 && release.resource_version() != it->second.resource_version()) {
    throw util::Conflict("release was modified concurrently: " + Describe(release.namespace_(), release.name()));
  }

  *it->second.mutable_spec() = release.spec();
  it->second.set_resource_version(++resource_version_);

  v1::Release stored = it->second;
  Notify(lock, EventType::kModified, stored);
  return stored;
}

v1::Release MemoryReleaseBackend::UpdateReleaseStatus(const std::string& release_namespace, const std::string& name,
                                                      const v1::ReleaseStatus& status) {
  std::lock_guard  dispatch(dispatch_mutex_);
  std::unique_lock lock(mutex_);

  auto it = releases_.find({release_namespace, name});
  if (it == releases_.end()) {
    throw util::NotFound("release not found: " + Describe(release_namespace, name));
  }

  *it->second.mutable_status() = status;
  *it->second.mutable_status()->mutable_last_update_time() = util::ToProto(util::Now());
  it->second.set_resource_version(++resource_version_);

  v1::Release stored = it->second;
  Notify(lock, EventType::kModified, stored);
  return stored;
}

void MemoryReleaseBackend::DeleteRelease(const std::string& release_namespace, const std::string& name) {
  std::lock_guard  dispatch(dispatch_mutex_);
  std::unique_lock lock(mutex_);

  auto it = releases_.find({release_namespace, name});
  if (it == releases_.end()) {
    throw util::NotFound("release not found: " + Describe(release_namespace, name));
  }

  v1::Release removed = std::move(it->second);
  releases_.erase(it);

  Notify(lock, EventType::kDeleted, removed);
}

void MemoryReleaseBackend::CreateHistory(const v1::ReleaseHistory& history) {
  std::lock_guard lock(mutex_);

  auto& versions = histories_[{history.namespace_(), history.name()}];
  if (versions.contains(history.version())) {
    throw util::AlreadyExists("release history already exists: " + Describe(history.namespace_(), history.name()) + " v" +
                              std::to_string(history.version()));
  }
  versions[history.version()] = history;
}

std::vector<v1::ReleaseHistory> MemoryReleaseBackend::ListHistories(const std::string& release_namespace, const std::string& name) {
  std::lock_guard                 lock(mutex_);
  std::vector<v1::ReleaseHistory> out;

  auto it = histories_.find({release_namespace, name});
  if (it == histories_.end()) return out;

  for (const auto& [_, history] : it->second) out.push_back(history);
  return out;
}

std::vector<v1::ReleaseHistory> MemoryReleaseBackend::ListAllHistories() {
  std::lock_guard                 lock(mutex_);
  std::vector<v1::ReleaseHistory> out;
  for (const auto& [_, versions] : histories_) {
    for (const auto& entry : versions) out.push_back(entry.second);
  }
  return out;
}

void MemoryReleaseBackend::DeleteHistories(const std::string& release_namespace, const std::string& name) {
  std::lock_guard lock(mutex_);
  histories_.erase({release_namespace, name});
}

ListWatchResult MemoryReleaseBackend::ListAndWatch(WatchHandler handler) {
  std::lock_guard lock(mutex_);

  ListWatchResult result;
  result.items.reserve(releases_.size());
  for (const auto& [_, release] : releases_) result.items.push_back(release);

  result.watch_id            = next_watch_id_++;
  watchers_[result.watch_id] = std::move(handler);
  return result;
}

void MemoryReleaseBackend::StopWatch(std::uint64_t watch_id) {
  // Waits out an in-flight dispatch so the handler is not called afterwards.
  std::lock_guard dispatch(dispatch_mutex_);
  std::lock_guard lock(mutex_);
  watchers_.erase(watch_id);
}

} // namespace releasectl::storage::memory
