#include "internal/release/manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/render/renderer.hpp"
#include "internal/resources/memory/memory_resource_client.hpp"
#include "internal/storage/condition.hpp"
#include "internal/storage/memory/memory_release_backend.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace releasectl;

constexpr const char* kWebAndService = R"(kind: Deployment
metadata:
  name: web
---
kind: Service
metadata:
  name: web
)";

constexpr const char* kWebOnly = R"(kind: Deployment
metadata:
  name: web
spec:
  replicas: 3
)";

constexpr const char* kApiOnly = R"(kind: Deployment
metadata:
  name: api
)";

struct Fixture {
  std::shared_ptr<storage::memory::MemoryReleaseBackend>   backend  = std::make_shared<storage::memory::MemoryReleaseBackend>();
  std::shared_ptr<resources::memory::MemoryResourceClient> client   = std::make_shared<resources::memory::MemoryResourceClient>();
  std::shared_ptr<render::ManifestRenderer>                renderer = std::make_shared<render::ManifestRenderer>();
  release::Manager                                         manager{backend, renderer, client};

  v1::Release Create(const std::string& ns, const std::string& name, const std::string& manifest) {
    v1::Release release;
    release.set_namespace_(ns);
    release.set_name(name);
    release.mutable_spec()->set_template_(manifest);
    return backend->CreateRelease(release);
  }

  v1::Release SetSpec(const std::string& ns, const std::string& name, const v1::ReleaseSpec& spec) {
    auto release            = *backend->GetRelease(ns, name);
    *release.mutable_spec() = spec;
    release.set_resource_version(0);
    return backend->UpdateRelease(release);
  }

  v1::Release Current(const std::string& ns, const std::string& name) {
    return *backend->GetRelease(ns, name);
  }
};

std::string LifecycleReason(const v1::Release& release) {
  auto condition = storage::LifecycleCondition(release.status());
  return condition ? condition->reason() : "";
}

bool TriggerFails(Fixture& f, const v1::Release& release) {
  try {
    f.manager.Trigger(release);
  } catch (const util::ConvergenceError&) {
    return true;
  }
  return false;
}

void TestTriggerCreatesResourcesHistoryAndAvailableStatus() {
  Fixture f;
  auto    release = f.Create("a", "r1", kWebAndService);

  f.manager.Trigger(release);

  const auto current = f.Current("a", "r1");
  assert(current.status().version() == 1);
  assert(LifecycleReason(current) == "Available");
  assert(storage::IsAvailable(current.status()));
  assert(current.status().manifest().find("kind: Service") != std::string::npos);

  const auto histories = f.backend->ListHistories("a", "r1");
  assert(histories.size() == 1);
  assert(histories[0].version() == 1);
  assert(histories[0].manifest() == current.status().manifest());

  assert(f.client->Size() == 2);
  assert(f.client->ListByOwner("a/r1").size() == 2);
}

void TestRepeatedTriggerOnUnchangedReleaseDoesNothing() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "r1", kWebAndService));

  const auto before         = f.Current("a", "r1");
  const auto writes_before  = f.client->Writes();
  const auto deletes_before = f.client->Deletes();

  f.manager.Trigger(before);
  f.manager.Trigger(before);

  const auto after = f.Current("a", "r1");
  assert(after.resource_version() == before.resource_version());
  assert(f.client->Writes() == writes_before);
  assert(f.client->Deletes() == deletes_before);
  assert(f.backend->ListHistories("a", "r1").size() == 1);
}

void TestSpecChangeUpdatesAndPrunesResources() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "r1", kWebAndService));

  v1::ReleaseSpec spec;
  spec.set_template_(kWebOnly);
  f.manager.Trigger(f.SetSpec("a", "r1", spec));

  const auto current = f.Current("a", "r1");
  assert(current.status().version() == 2);
  assert(LifecycleReason(current) == "Available");
  assert(f.backend->ListHistories("a", "r1").size() == 2);

  const auto owned = f.client->ListByOwner("a/r1");
  assert(owned.size() == 1);
  assert(owned[0].kind == "Deployment");
  assert(owned[0].body.find("replicas: 3") != std::string::npos);
}

void TestRollbackRestoresRecordedSpec() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "r1", kWebAndService));

  v1::ReleaseSpec updated;
  updated.set_template_(kWebOnly);
  f.manager.Trigger(f.SetSpec("a", "r1", updated));
  assert(f.client->Size() == 1);

  v1::ReleaseSpec rollback = updated;
  rollback.mutable_rollback_to()->set_version(1);
  f.manager.Trigger(f.SetSpec("a", "r1", rollback));

  const auto current = f.Current("a", "r1");
  assert(current.status().version() == 3);
  assert(LifecycleReason(current) == "Available");
  assert(current.spec().template_() == kWebAndService);
  assert(!current.spec().has_rollback_to());
  assert(current.status().rolled_back_to() == 1);
  assert(f.client->Size() == 2);

  const auto histories = f.backend->ListHistories("a", "r1");
  assert(histories.size() == 3);
  assert(histories[2].spec().template_() == kWebAndService);

  // Converged: a further trigger is a no-op.
  const auto version_before = current.resource_version();
  f.manager.Trigger(current);
  assert(f.Current("a", "r1").resource_version() == version_before);
}

void TestRepeatedRollbackRequestOnlyRestoresSpec() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "r1", kWebAndService));

  v1::ReleaseSpec updated;
  updated.set_template_(kWebOnly);
  f.manager.Trigger(f.SetSpec("a", "r1", updated));

  v1::ReleaseSpec rollback = updated;
  rollback.mutable_rollback_to()->set_version(1);
  f.manager.Trigger(f.SetSpec("a", "r1", rollback));
  assert(f.backend->ListHistories("a", "r1").size() == 3);

  // The same request arrives again, as when a stale copy of the spec is re-applied.
  f.manager.Trigger(f.SetSpec("a", "r1", rollback));
  auto current = f.Current("a", "r1");
  assert(f.backend->ListHistories("a", "r1").size() == 3);
  assert(current.status().version() == 3);
  assert(current.spec().template_() == kWebAndService);
  assert(!current.spec().has_rollback_to());
  assert(LifecycleReason(current) == "Available");
  assert(f.client->Size() == 2);

  const auto version_before = current.resource_version();
  f.manager.Trigger(current);
  assert(f.Current("a", "r1").resource_version() == version_before);

  // After a later update the same target is a fresh rollback again.
  f.manager.Trigger(f.SetSpec("a", "r1", updated));
  assert(f.Current("a", "r1").status().rolled_back_to() == 0);
  f.manager.Trigger(f.SetSpec("a", "r1", rollback));
  current = f.Current("a", "r1");
  assert(f.backend->ListHistories("a", "r1").size() == 5);
  assert(current.status().version() == 5);
  assert(current.status().rolled_back_to() == 1);
  assert(current.spec().template_() == kWebAndService);
}

void TestRollbackToUnknownVersionRecordsFailure() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "r1", kWebAndService));

  v1::ReleaseSpec spec;
  spec.set_template_(kWebAndService);
  spec.mutable_rollback_to()->set_version(7);

  assert(TriggerFails(f, f.SetSpec("a", "r1", spec)));

  const auto current = f.Current("a", "r1");
  assert(LifecycleReason(current) == "Failure");
  assert(storage::LifecycleCondition(current.status())->message().find("7") != std::string::npos);
  assert(f.backend->ListHistories("a", "r1").size() == 1);
}

void TestRenderFailureRecordsFailureAndLeavesResources() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "r1", kWebAndService));

  v1::ReleaseSpec broken;
  broken.set_template_("kind: Deployment\n");
  assert(TriggerFails(f, f.SetSpec("a", "r1", broken)));

  auto current = f.Current("a", "r1");
  assert(LifecycleReason(current) == "Failure");
  assert(current.status().version() == 1);
  assert(f.client->Size() == 2);

  // Fixing the spec converges on the next trigger.
  v1::ReleaseSpec fixed;
  fixed.set_template_(kWebOnly);
  f.manager.Trigger(f.SetSpec("a", "r1", fixed));
  current = f.Current("a", "r1");
  assert(LifecycleReason(current) == "Available");
  assert(current.status().version() == 2);
}

void TestTriggerOfVanishedReleaseIsQuiet() {
  Fixture f;
  auto    release = f.Create("a", "r1", kWebAndService);
  f.backend->DeleteRelease("a", "r1");

  f.manager.Trigger(release);
  assert(f.client->Size() == 0);
}

void TestDeleteRemovesResourcesAndHistoriesIdempotently() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "r1", kWebAndService));
  f.manager.Trigger(f.Create("a", "r2", kApiOnly));
  f.backend->DeleteRelease("a", "r1");

  f.manager.Delete("a", "r1");
  assert(f.client->ListByOwner("a/r1").empty());
  assert(f.backend->ListHistories("a", "r1").empty());
  assert(f.client->ListByOwner("a/r2").size() == 1);

  f.manager.Delete("a", "r1");
  f.manager.Delete("a", "never-existed");
}

void TestRunSweepsLeftoversOfDeletedReleases() {
  Fixture f;
  f.manager.Trigger(f.Create("a", "live", kApiOnly));
  f.manager.Trigger(f.Create("a", "gone", kWebAndService));

  // Deleted while nobody was watching.
  f.backend->DeleteRelease("a", "gone");
  assert(f.client->ListByOwner("a/gone").size() == 2);

  f.manager.Run();

  assert(f.client->ListByOwner("a/gone").empty());
  assert(f.backend->ListHistories("a", "gone").empty());
  assert(f.client->ListByOwner("a/live").size() == 1);
  assert(f.backend->ListHistories("a", "live").size() == 1);

  const auto deletes = f.client->Deletes();
  f.manager.Run();
  assert(f.client->Deletes() == deletes);
}

} // namespace

int main() {
  TestTriggerCreatesResourcesHistoryAndAvailableStatus();
  TestRepeatedTriggerOnUnchangedReleaseDoesNothing();
  TestSpecChangeUpdatesAndPrunesResources();
  TestRollbackRestoresRecordedSpec();
  TestRepeatedRollbackRequestOnlyRestoresSpec();
  TestRollbackToUnknownVersionRecordsFailure();
  TestRenderFailureRecordsFailureAndLeavesResources();
  TestTriggerOfVanishedReleaseIsQuiet();
  TestDeleteRemovesResourcesAndHistoriesIdempotently();
  TestRunSweepsLeftoversOfDeletedReleases();

  std::cout << "releasectl_unit_release_manager: pass\n";
  return 0;
}
