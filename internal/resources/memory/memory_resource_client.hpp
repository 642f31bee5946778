#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/resources/resource_client.hpp"

namespace releasectl::resources::memory {

/*
  In-process live state. Counts the writes that actually changed
  something so callers can verify idempotence.
*/
class MemoryResourceClient final : public ResourceClient {
 public:
  bool                     Apply(const Resource& resource) override;
  bool                     Delete(const Resource& resource) override;
  std::vector<Resource>    ListByOwner(const std::string& owner) override;
  std::vector<std::string> ListOwners() override;

  std::size_t   Size() const;
  std::uint64_t Writes() const;
  std::uint64_t Deletes() const;

 private:
  mutable std::mutex              mutex_;
  std::map<std::string, Resource> resources_;
  std::uint64_t                   writes_  = 0;
  std::uint64_t                   deletes_ = 0;
};

} // namespace releasectl::resources::memory
