#include "internal/render/renderer.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace releasectl;
using render::ManifestRenderer;

v1::ReleaseSpec SpecWithTemplate(const std::string& manifest) {
  v1::ReleaseSpec spec;
  spec.set_template_(manifest);
  return spec;
}

bool RenderThrows(const std::string& manifest) {
  ManifestRenderer renderer;
  try {
    (void)renderer.Render("a", "r1", SpecWithTemplate(manifest));
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestMultiDocumentManifestRendersEveryResource() {
  ManifestRenderer renderer;
  const auto       rendered = renderer.Render("a", "r1", SpecWithTemplate(R"(kind: Deployment
metadata:
  name: web
spec:
  replicas: 2
---
---
kind: Service
metadata:
  name: web
)"));

  assert(rendered.size() == 2);
  assert(rendered[0].kind == "Deployment");
  assert(rendered[0].name == "web");
  assert(rendered[0].resource_namespace == "a");
  assert(rendered[0].owner == "a/r1");
  assert(rendered[0].body.find("replicas: 2") != std::string::npos);
  assert(rendered[1].kind == "Service");
  assert(resources::ResourceID(rendered[1]) == "Service/a/web");

  const auto manifest = render::JoinManifest(rendered);
  assert(manifest.find("---\n") == 0);
  assert(manifest.find("kind: Service") != std::string::npos);
}

void TestEmptyTemplateRendersNothing() {
  ManifestRenderer renderer;
  assert(renderer.Render("a", "r1", SpecWithTemplate("")).empty());
  assert(render::JoinManifest({}).empty());
}

void TestInvalidDocumentsAreRejected() {
  assert(RenderThrows("kind: Deployment\n"));
  assert(RenderThrows("- just\n- a list\n"));
  assert(RenderThrows("kind: [unterminated\n"));
  assert(RenderThrows("kind: Service\nmetadata: {name: web}\n---\nkind: Service\nmetadata: {name: web}\n"));
}

} // namespace

int main() {
  TestMultiDocumentManifestRendersEveryResource();
  TestEmptyTemplateRendersNothing();
  TestInvalidDocumentsAreRejected();

  std::cout << "releasectl_unit_renderer: pass\n";
  return 0;
}
