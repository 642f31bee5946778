#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/grpc/admin_server.hpp"
#include "internal/queue/rate_limiter.hpp"
#include "internal/queue/rate_limiting_queue.hpp"
#include "internal/release/manager.hpp"
#include "internal/render/renderer.hpp"
#include "internal/resources/memory/memory_resource_client.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/memory/memory_release_backend.hpp"

namespace releasectl::factory {

using namespace releasectl;

controller::ControllerOptions ControllerOptionsFromConfig(const releasectl::runtime::config::RuntimeConfig& config) {
  const auto& controller = config.controller();

  controller::ControllerOptions options;
  options.workers         = controller.workers();
  options.worker_period   = std::chrono::milliseconds(controller.worker_period_ms());
  options.cache_sync_poll = std::chrono::milliseconds(controller.cache_sync_poll_ms());
  options.periodic_sweep  = controller.periodic_sweep();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const releasectl::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Release store and its cache
  // ------------------------------------------------------------------
  app.backend  = std::make_shared<storage::memory::MemoryReleaseBackend>();
  app.informer = std::make_shared<cache::BackendInformer>(app.backend);

  // ------------------------------------------------------------------
  // Action executor
  // ------------------------------------------------------------------
  auto renderer = std::make_shared<render::ManifestRenderer>();
  auto client   = std::make_shared<resources::memory::MemoryResourceClient>();
  auto manager  = std::make_shared<release::Manager>(app.backend, renderer, client);

  // ------------------------------------------------------------------
  // Controller
  // ------------------------------------------------------------------
  const auto&               limiter_config = config.controller().rate_limiter();
  queue::RateLimiterOptions limiter_options;
  limiter_options.base_delay = std::chrono::milliseconds(limiter_config.base_delay_ms());
  limiter_options.max_delay  = std::chrono::milliseconds(limiter_config.max_delay_ms());
  limiter_options.qps        = limiter_config.qps();
  limiter_options.burst      = limiter_config.burst();

  auto work_queue = std::make_shared<queue::RateLimitingQueue>(queue::DefaultControllerRateLimiter(limiter_options));
  app.controller  = std::make_shared<controller::ReleaseController>(ControllerOptionsFromConfig(config), manager, app.informer, work_queue);

  // ------------------------------------------------------------------
  // Release source
  // ------------------------------------------------------------------
  if (!config.source().manifest_dir().empty()) {
    app.source = std::make_shared<source::ManifestSource>(config.source().manifest_dir(), app.backend,
                                                          std::chrono::milliseconds(config.source().poll_interval_ms()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.controller = app.controller;
  ctx.informer   = app.informer;
  ctx.backend    = app.backend;

  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace releasectl::factory
