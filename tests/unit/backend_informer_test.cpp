#include "internal/cache/backend_informer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "internal/runtime/stop_signal.hpp"
#include "internal/storage/memory/memory_release_backend.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace releasectl;
using cache::BackendInformer;
using cache::DeletedFinalStateUnknown;
using cache::DeletedObject;
using storage::memory::MemoryReleaseBackend;

struct Recorded {
  std::vector<std::string> events;

  cache::ResourceEventHandlerFuncs Funcs() {
    cache::ResourceEventHandlerFuncs funcs;
    funcs.on_add    = [this](const v1::Release& obj) { events.push_back("add " + obj.namespace_() + "/" + obj.name()); };
    funcs.on_update = [this](const v1::Release&, const v1::Release& obj) { events.push_back("update " + obj.namespace_() + "/" + obj.name()); };
    funcs.on_delete = [this](const DeletedObject& obj) {
      if (const auto* tombstone = std::get_if<DeletedFinalStateUnknown>(&obj)) {
        events.push_back("tombstone " + tombstone->key);
      } else {
        const auto& release = std::get<v1::Release>(obj);
        events.push_back("delete " + release.namespace_() + "/" + release.name());
      }
    };
    return funcs;
  }
};

v1::Release MakeRelease(const std::string& ns, const std::string& name) {
  v1::Release release;
  release.set_namespace_(ns);
  release.set_name(name);
  return release;
}

void TestStartListsExistingReleasesAndSyncs() {
  auto backend = std::make_shared<MemoryReleaseBackend>();
  backend->CreateRelease(MakeRelease("a", "r1"));
  backend->CreateRelease(MakeRelease("a", "r2"));

  BackendInformer informer(backend);
  Recorded        recorded;
  informer.AddEventHandler(recorded.Funcs());

  assert(!informer.HasSynced());
  informer.Start();
  assert(informer.HasSynced());

  assert(recorded.events.size() == 2);
  assert(recorded.events[0] == "add a/r1");
  assert(recorded.events[1] == "add a/r2");
  assert(informer.List().size() == 2);
  assert(informer.Get("a", "r1").has_value());
  assert(!informer.Get("a", "missing").has_value());
}

void TestWatchEventsUpdateCacheAndNotify() {
  auto            backend = std::make_shared<MemoryReleaseBackend>();
  BackendInformer informer(backend);
  Recorded        recorded;
  informer.AddEventHandler(recorded.Funcs());
  informer.Start();

  backend->CreateRelease(MakeRelease("a", "r1"));
  auto updated = MakeRelease("a", "r1");
  updated.mutable_spec()->set_description("changed");
  backend->UpdateRelease(updated);
  assert(informer.Get("a", "r1")->spec().description() == "changed");

  backend->DeleteRelease("a", "r1");
  assert(!informer.Get("a", "r1").has_value());

  assert(recorded.events.size() == 3);
  assert(recorded.events[0] == "add a/r1");
  assert(recorded.events[1] == "update a/r1");
  assert(recorded.events[2] == "delete a/r1");
}

void TestDeletionWhileStoppedIsReportedAsTombstone() {
  auto            backend = std::make_shared<MemoryReleaseBackend>();
  BackendInformer informer(backend);
  Recorded        recorded;
  informer.AddEventHandler(recorded.Funcs());

  backend->CreateRelease(MakeRelease("a", "r1"));
  backend->CreateRelease(MakeRelease("a", "r2"));
  informer.Start();
  informer.Stop();

  backend->DeleteRelease("a", "r1");
  auto changed = MakeRelease("a", "r2");
  changed.mutable_spec()->set_description("changed");
  backend->UpdateRelease(changed);

  recorded.events.clear();
  informer.Start();

  assert(recorded.events.size() == 2);
  assert(recorded.events[0] == "update a/r2");
  assert(recorded.events[1] == "tombstone a/r1");
  assert(!informer.Get("a", "r1").has_value());
}

void TestInvalidLookupKeyIsLookupError() {
  auto            backend = std::make_shared<MemoryReleaseBackend>();
  BackendInformer informer(backend);
  informer.Start();

  bool threw = false;
  try {
    (void)informer.Get("a", "Not_Valid");
  } catch (const util::LookupError&) {
    threw = true;
  }
  assert(threw);
}

void TestWaitForCacheSyncHonoursStop() {
  runtime::StopSignal stop;
  stop.Stop();
  assert(!cache::WaitForCacheSync(stop, {[] { return false; }}, std::chrono::milliseconds(1)));

  runtime::StopSignal running;
  assert(cache::WaitForCacheSync(running, {[] { return true; }}, std::chrono::milliseconds(1)));
}

} // namespace

int main() {
  TestStartListsExistingReleasesAndSyncs();
  TestWatchEventsUpdateCacheAndNotify();
  TestDeletionWhileStoppedIsReportedAsTombstone();
  TestInvalidLookupKeyIsLookupError();
  TestWaitForCacheSyncHonoursStop();

  std::cout << "releasectl_unit_backend_informer: pass\n";
  return 0;
}
