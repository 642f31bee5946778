#include "renderer.hpp"

#include <yaml-cpp/yaml.h>

#include <set>
#include <stdexcept>

#include "internal/cache/key.hpp"

namespace releasectl::render {

namespace {

std::string ScalarAt(const YAML::Node& node, const char* field) {
  const auto value = node[field];
  if (!value || !value.IsScalar()) return {};
  return value.Scalar();
}

} // namespace

std::vector<resources::Resource> ManifestRenderer::Render(const std::string& release_namespace, const std::string& name,
                                                          const v1::ReleaseSpec& spec) {
  std::vector<YAML::Node> documents;
  try {
    documents = YAML::LoadAll(spec.template_());
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("invalid manifest: " + std::string(e.what()));
  }

  const auto owner = cache::MetaNamespaceKey(release_namespace, name);

  std::vector<resources::Resource> rendered;
  std::set<std::string>            seen;
  for (std::size_t i = 0; i < documents.size(); ++i) {
    const auto& doc = documents[i];
    if (doc.IsNull()) continue;
    if (!doc.IsMap()) {
      throw std::runtime_error("manifest document " + std::to_string(i) + " is not a mapping");
    }

    resources::Resource resource;
    resource.kind = ScalarAt(doc, "kind");
    if (doc["metadata"] && doc["metadata"].IsMap()) {
      resource.name = ScalarAt(doc["metadata"], "name");
    }
    if (resource.kind.empty() || resource.name.empty()) {
      throw std::runtime_error("manifest document " + std::to_string(i) + " needs kind and metadata.name");
    }

    resource.resource_namespace = release_namespace;
    resource.owner              = owner;

    YAML::Emitter out;
    out << doc;
    resource.body = out.c_str();

    if (!seen.insert(resources::ResourceID(resource)).second) {
      throw std::runtime_error("duplicate resource in manifest: " + resource.kind + "/" + resource.name);
    }
    rendered.push_back(std::move(resource));
  }

  return rendered;
}

std::string JoinManifest(const std::vector<resources::Resource>& rendered) {
  std::string manifest;
  for (const auto& resource : rendered) {
    manifest += "---\n";
    manifest += resource.body;
    manifest += "\n";
  }
  return manifest;
}

} // namespace releasectl::render
