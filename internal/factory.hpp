#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/cache/backend_informer.hpp"
#include "internal/controller/release_controller.hpp"
#include "internal/source/manifest_source.hpp"
#include "internal/storage/release_backend.hpp"

namespace releasectl::factory {

/*
  Application

  Owns all long-lived components of the controller process. Everything here
  lives for the lifetime of the process; main() starts and stops them.
*/
struct Application {
  std::shared_ptr<storage::ReleaseBackend>        backend;
  std::shared_ptr<cache::BackendInformer>         informer;
  std::shared_ptr<controller::ReleaseController>  controller;

  // Null when no manifest directory is configured.
  std::shared_ptr<source::ManifestSource> source;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

controller::ControllerOptions ControllerOptionsFromConfig(const releasectl::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole dependency graph from runtime config.

  This is the composition root of the application and the only place that
  knows concrete backend, renderer and resource client types.
*/
Application Build(const releasectl::runtime::config::RuntimeConfig& config);

} // namespace releasectl::factory
