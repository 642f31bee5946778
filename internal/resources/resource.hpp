#pragma once

#include <string>

namespace releasectl::resources {

/*
  A deployable object rendered from a release manifest.

  Identity is (kind, namespace, name); owner is the reconcile key of the
  release that created it.
*/
struct Resource {
  std::string kind;
  std::string resource_namespace;
  std::string name;
  std::string owner;
  std::string body;
};

inline std::string ResourceID(const Resource& resource) {
  return resource.kind + "/" + resource.resource_namespace + "/" + resource.name;
}

} // namespace releasectl::resources
