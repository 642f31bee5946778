#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "releasectl/admin/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace releasectl::grpc {

class AdminServer final : public releasectl::admin::v1::ReleaseControllerAdmin::Service {
public:
  explicit AdminServer(std::shared_ptr<releasectl::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const releasectl::admin::v1::StatsRequest*,
                       releasectl::admin::v1::StatsResponse*) override;

  ::grpc::Status ListReleases(::grpc::ServerContext*,
                              const releasectl::admin::v1::ListReleasesRequest*,
                              releasectl::admin::v1::ListReleasesResponse*) override;

  ::grpc::Status GetRelease(::grpc::ServerContext*,
                            const releasectl::admin::v1::GetReleaseRequest*,
                            releasectl::admin::v1::GetReleaseResponse*) override;

private:
  std::shared_ptr<releasectl::service::AdminService> service_;
};

}
