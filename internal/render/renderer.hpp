#pragma once

#include <string>
#include <vector>

#include "internal/resources/resource.hpp"
#include "releasectl/v1/release.pb.h"

namespace releasectl::render {

/*
  Turns a release spec into deployable resources. Throws on a manifest
  that cannot be rendered.
*/
class Renderer {
 public:
  virtual ~Renderer() = default;

  virtual std::vector<resources::Resource> Render(const std::string& release_namespace, const std::string& name,
                                                  const v1::ReleaseSpec& spec) = 0;
};

/*
  Splits spec.template into YAML documents, one resource each. Every
  document needs a `kind` and a `metadata.name`; (kind, name) must be
  unique within the release. No substitution is performed.
*/
class ManifestRenderer final : public Renderer {
 public:
  std::vector<resources::Resource> Render(const std::string& release_namespace, const std::string& name,
                                          const v1::ReleaseSpec& spec) override;
};

// The canonical manifest text recorded in release status and history.
std::string JoinManifest(const std::vector<resources::Resource>& rendered);

} // namespace releasectl::render
