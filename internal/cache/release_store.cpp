#include "release_store.hpp"

namespace releasectl::cache {

std::optional<v1::Release> ReleaseStore::Upsert(const std::string& key, const v1::Release& release) {
  std::unique_lock lock(mutex_);

  std::optional<v1::Release> previous;
  auto                       it = items_.find(key);
  if (it != items_.end()) previous = std::move(it->second);

  items_[key] = release;
  return previous;
}

std::optional<v1::Release> ReleaseStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);

  auto it = items_.find(key);
  if (it == items_.end()) return std::nullopt;

  v1::Release removed = std::move(it->second);
  items_.erase(it);
  return removed;
}

std::optional<v1::Release> ReleaseStore::Get(const std::string& key) const {
  std::shared_lock lock(mutex_);

  auto it = items_.find(key);
  if (it == items_.end()) return std::nullopt;
  return it->second;
}

std::vector<v1::Release> ReleaseStore::List() const {
  std::shared_lock         lock(mutex_);
  std::vector<v1::Release> out;
  out.reserve(items_.size());
  for (const auto& [_, release] : items_) out.push_back(release);
  return out;
}

std::vector<std::string> ReleaseStore::ListKeys() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> out;
  out.reserve(items_.size());
  for (const auto& [key, _] : items_) out.push_back(key);
  return out;
}

std::size_t ReleaseStore::Size() const {
  std::shared_lock lock(mutex_);
  return items_.size();
}

} // namespace releasectl::cache
