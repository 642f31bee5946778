#include "memory_resource_client.hpp"

#include <set>

#include "internal/util/errors.hpp"

namespace releasectl::resources::memory {

bool MemoryResourceClient::Apply(const Resource& resource) {
  std::lock_guard lock(mutex_);

  const auto id = ResourceID(resource);
  auto       it = resources_.find(id);
  if (it != resources_.end()) {
    if (it->second.owner != resource.owner) {
      throw util::Conflict("resource " + id + " is owned by " + it->second.owner);
    }
    if (it->second.body == resource.body) return false;
  }

  resources_[id] = resource;
  ++writes_;
  return true;
}

bool MemoryResourceClient::Delete(const Resource& resource) {
  std::lock_guard lock(mutex_);

  if (resources_.erase(ResourceID(resource)) == 0) return false;
  ++deletes_;
  return true;
}

std::vector<Resource> MemoryResourceClient::ListByOwner(const std::string& owner) {
  std::lock_guard       lock(mutex_);
  std::vector<Resource> out;
  for (const auto& [_, resource] : resources_) {
    if (resource.owner == owner) out.push_back(resource);
  }
  return out;
}

std::vector<std::string> MemoryResourceClient::ListOwners() {
  std::lock_guard       lock(mutex_);
  std::set<std::string> owners;
  for (const auto& [_, resource] : resources_) owners.insert(resource.owner);
  return {owners.begin(), owners.end()};
}

std::size_t MemoryResourceClient::Size() const {
  std::lock_guard lock(mutex_);
  return resources_.size();
}

std::uint64_t MemoryResourceClient::Writes() const {
  std::lock_guard lock(mutex_);
  return writes_;
}

std::uint64_t MemoryResourceClient::Deletes() const {
  std::lock_guard lock(mutex_);
  return deletes_;
}

} // namespace releasectl::resources::memory
