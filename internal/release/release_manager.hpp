#pragma once

#include <string>

#include "releasectl/v1/release.pb.h"

namespace releasectl::release {

/*
  Performs the create/update/rollback/delete work behind the controller.

  All operations are idempotent and throw on failure; the controller
  retries them with backoff.
*/
class ReleaseManager {
 public:
  virtual ~ReleaseManager() = default;

  // Converges live state toward release's spec and records the outcome as
  // a lifecycle condition. Repeated calls on an unchanged release do nothing.
  virtual void Trigger(const v1::Release& release) = 0;

  // Tears down everything left by a release that no longer exists.
  // Succeeds when there is nothing to delete.
  virtual void Delete(const std::string& release_namespace, const std::string& name) = 0;

  // Consistency sweep: repairs state left by an unclean shutdown. Cheap
  // when there is nothing to repair.
  virtual void Run() = 0;
};

} // namespace releasectl::release
