#pragma once

#include <memory>

namespace releasectl::controller { class ReleaseController; }
namespace releasectl::cache { class ReleaseInformer; }
namespace releasectl::storage { class ReleaseBackend; }

namespace releasectl::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<releasectl::controller::ReleaseController> controller;
  std::shared_ptr<releasectl::cache::ReleaseInformer> informer;
  std::shared_ptr<releasectl::storage::ReleaseBackend> backend;
};

}
