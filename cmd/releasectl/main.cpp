#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <string>

#include "releasectl/admin/v1/admin_service.grpc.pb.h"
#include "releasectl/v1.hpp"

using namespace releasectl::api;

static void Usage() {
  std::cout << "Usage:\n"
            << "  releasectl <addr> stats\n"
            << "  releasectl <addr> list [namespace]\n"
            << "  releasectl <addr> get <namespace/name>\n";
}

static std::string ConditionSummary(const Release& release) {
  if (release.status().conditions().empty()) return "-";
  const auto& condition = release.status().conditions(0);
  return condition.reason().empty() ? ConditionType_Name(condition.type()) : condition.reason();
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ReleaseControllerAdmin::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = stub->Stats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "queue_depth=" << resp.queue_depth() << "\n";
    std::cout << "waiting=" << resp.waiting() << "\n";
    std::cout << "workers=" << resp.workers() << "\n";
    std::cout << "cache_synced=" << (resp.cache_synced() ? "true" : "false") << "\n";
    std::cout << "reconciles_ok=" << resp.reconciles_ok() << "\n";
    std::cout << "reconciles_failed=" << resp.reconciles_failed() << "\n";
    std::cout << "requeues=" << resp.requeues() << "\n";
    std::cout << "dropped_keys=" << resp.dropped_keys() << "\n";
    std::cout << "releases=" << resp.releases() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListReleasesRequest req;
    if (argc >= 4) req.set_namespace_(argv[3]);

    ListReleasesResponse resp;

    auto status = stub->ListReleases(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& release : resp.releases()) {
      std::cout << release.namespace_() << "/" << release.name() << " version=" << release.status().version()
                << " condition=" << ConditionSummary(release) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetReleaseRequest req;
    req.set_key(argv[3]);

    GetReleaseResponse resp;

    auto status = stub->GetRelease(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;

    std::string json;
    auto        json_status = google::protobuf::util::MessageToJsonString(resp, &json, options);
    if (!json_status.ok()) {
      std::cerr << json_status.message() << "\n";
      return 2;
    }

    std::cout << json;
    return 0;
  }

  Usage();
  return 1;
}
