#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "releasectl/v1.hpp"

namespace releasectl::grpc {

using namespace releasectl::api;

AdminServer::AdminServer(std::shared_ptr<releasectl::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListReleases(::grpc::ServerContext*, const ListReleasesRequest* req, ListReleasesResponse* resp) {
  try {
    *resp = service_->ListReleases(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetRelease(::grpc::ServerContext*, const GetReleaseRequest* req, GetReleaseResponse* resp) {
  try {
    *resp = service_->GetRelease(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace releasectl::grpc
