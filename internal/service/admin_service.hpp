#pragma once

#include "releasectl/admin/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace releasectl::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  releasectl::admin::v1::StatsResponse
  Stats(const releasectl::admin::v1::StatsRequest& req);

  releasectl::admin::v1::ListReleasesResponse
  ListReleases(const releasectl::admin::v1::ListReleasesRequest& req);

  // Reads the live backend copy, so the answer reflects writes the cache
  // may not have seen yet.
  releasectl::admin::v1::GetReleaseResponse
  GetRelease(const releasectl::admin::v1::GetReleaseRequest& req);

private:
  ServiceContext ctx_;
};

}
