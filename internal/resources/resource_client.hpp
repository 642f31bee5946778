#pragma once

#include <string>
#include <vector>

#include "internal/resources/resource.hpp"

namespace releasectl::resources {

/*
  Live-state client for rendered resources.

  Apply and Delete are idempotent: applying an identical body or deleting
  an absent resource changes nothing. Failures throw.
*/
class ResourceClient {
 public:
  virtual ~ResourceClient() = default;

  // Creates or replaces resource. Returns true if live state changed.
  virtual bool Apply(const Resource& resource) = 0;

  // Returns true if something was removed.
  virtual bool Delete(const Resource& resource) = 0;

  virtual std::vector<Resource> ListByOwner(const std::string& owner) = 0;

  // Every owner that still has at least one resource.
  virtual std::vector<std::string> ListOwners() = 0;
};

} // namespace releasectl::resources
