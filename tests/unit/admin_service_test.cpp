#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/cache/backend_informer.hpp"
#include "internal/controller/release_controller.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/queue/rate_limiter.hpp"
#include "internal/queue/rate_limiting_queue.hpp"
#include "internal/release/manager.hpp"
#include "internal/render/renderer.hpp"
#include "internal/resources/memory/memory_resource_client.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/memory/memory_release_backend.hpp"
#include "releasectl/v1.hpp"

namespace {

using namespace releasectl;

struct Harness {
  Harness() {
    backend  = std::make_shared<storage::memory::MemoryReleaseBackend>();
    informer = std::make_shared<cache::BackendInformer>(backend);
    manager  = std::make_shared<release::Manager>(backend, std::make_shared<render::ManifestRenderer>(),
                                                 std::make_shared<resources::memory::MemoryResourceClient>());

    work_queue      = std::make_shared<queue::RateLimitingQueue>(queue::DefaultControllerRateLimiter());
    controller      = std::make_shared<controller::ReleaseController>(controller::ControllerOptions{}, manager, informer, work_queue);

    service::ServiceContext ctx;
    ctx.controller = controller;
    ctx.informer   = informer;
    ctx.backend    = backend;
    server         = std::make_unique<releasectl::grpc::AdminServer>(std::make_shared<service::AdminService>(ctx));
  }

  void AddRelease(const std::string& ns, const std::string& name) {
    v1::Release release;
    release.set_namespace_(ns);
    release.set_name(name);
    release.mutable_spec()->set_template_("kind: ConfigMap\nmetadata: {name: " + name + "}\n");
    backend->CreateRelease(release);
  }

  std::shared_ptr<storage::memory::MemoryReleaseBackend> backend;
  std::shared_ptr<cache::BackendInformer>                informer;
  std::shared_ptr<release::Manager>                      manager;
  std::shared_ptr<queue::RateLimitingQueue>              work_queue;
  std::shared_ptr<controller::ReleaseController>         controller;
  std::unique_ptr<releasectl::grpc::AdminServer>                     server;
};

::grpc::StatusCode GetReleaseCode(Harness& h, const std::string& key, api::GetReleaseResponse* resp) {
  api::GetReleaseRequest req;
  req.set_key(key);
  ::grpc::ServerContext grpc_ctx;
  return h.server->GetRelease(&grpc_ctx, &req, resp).error_code();
}

void TestGetUnknownReleaseReturnsNotFound() {
  Harness                 h;
  api::GetReleaseResponse resp;
  assert(GetReleaseCode(h, "a/missing", &resp) == ::grpc::StatusCode::NOT_FOUND);
}

void TestGetMalformedKeyReturnsInvalidArgument() {
  Harness                 h;
  api::GetReleaseResponse resp;
  assert(GetReleaseCode(h, "bad::key::format", &resp) == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestGetReturnsReleaseWithHistories() {
  Harness h;
  h.AddRelease("a", "r1");
  h.manager->Trigger(*h.backend->GetRelease("a", "r1"));

  api::GetReleaseResponse resp;
  assert(GetReleaseCode(h, "a/r1", &resp) == ::grpc::StatusCode::OK);
  assert(resp.release().name() == "r1");
  assert(resp.release().status().version() == 1);
  assert(resp.histories_size() == 1);
  assert(resp.histories(0).version() == 1);
}

void TestListFiltersByNamespace() {
  Harness h;
  h.AddRelease("a", "r1");
  h.AddRelease("a", "r2");
  h.AddRelease("b", "r1");

  api::ListReleasesRequest  req;
  api::ListReleasesResponse resp;
  ::grpc::ServerContext     grpc_ctx;

  req.set_namespace_("a");
  assert(h.server->ListReleases(&grpc_ctx, &req, &resp).ok());
  assert(resp.releases_size() == 2);

  req.clear_namespace_();
  assert(h.server->ListReleases(&grpc_ctx, &req, &resp).ok());
  assert(resp.releases_size() == 3);
}

void TestStatsReportsCacheAndQueue() {
  Harness h;
  h.AddRelease("a", "r1");
  h.AddRelease("a", "r2");

  api::StatsRequest     req;
  api::StatsResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  assert(h.server->Stats(&grpc_ctx, &req, &resp).ok());
  assert(!resp.cache_synced());
  assert(resp.releases() == 0);

  h.informer->Start();
  assert(h.server->Stats(&grpc_ctx, &req, &resp).ok());
  assert(resp.cache_synced());
  assert(resp.releases() == 2);
  assert(resp.queue_depth() == 2);
  assert(resp.waiting() == 0);
  assert(resp.workers() == 0);

  h.work_queue->AddAfter("a/r3", std::chrono::hours(1));
  assert(h.server->Stats(&grpc_ctx, &req, &resp).ok());
  assert(resp.waiting() == 1);
  assert(resp.queue_depth() == 2);
}

} // namespace

int main() {
  TestGetUnknownReleaseReturnsNotFound();
  TestGetMalformedKeyReturnsInvalidArgument();
  TestGetReturnsReleaseWithHistories();
  TestListFiltersByNamespace();
  TestStatsReportsCacheAndQueue();

  std::cout << "releasectl_unit_admin_service: pass\n";
  return 0;
}
