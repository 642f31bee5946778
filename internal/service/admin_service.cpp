#include "admin_service.hpp"

#include <chrono>
#include <string_view>

#include "internal/cache/informer.hpp"
#include "internal/cache/key.hpp"
#include "internal/controller/release_controller.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/release_backend.hpp"
#include "internal/util/errors.hpp"
#include "releasectl/v1.hpp"

namespace releasectl::service {

using namespace releasectl::api;

namespace {

// Runs one RPC body with the usual span, request metric and error log.
template <typename Fn>
auto Traced(std::string_view route, Fn&& fn) -> decltype(fn()) {
  releasectl::observability::SpanScope span(route);
  try {
    auto resp = fn();
    releasectl::observability::Metrics::Instance().RecordRequest(route, true);
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RELEASECTL_LOG_ERROR("RPC failed",
                         {releasectl::observability::StringField("route", route), releasectl::observability::StringField("error", ex.what())});
    releasectl::observability::Metrics::Instance().RecordRequest(route, false);
    throw;
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Traced("AdminService.Stats", [&] {
    const auto stats = ctx_.controller->Stats();

    StatsResponse resp;
    resp.set_queue_depth(stats.queue_depth);
    resp.set_waiting(stats.waiting);
    resp.set_workers(stats.workers);
    resp.set_cache_synced(stats.cache_synced);
    resp.set_reconciles_ok(stats.reconciles_ok);
    resp.set_reconciles_failed(stats.reconciles_failed);
    resp.set_requeues(stats.requeues);
    resp.set_dropped_keys(stats.dropped_keys);
    resp.set_releases(ctx_.informer->List().size());
    return resp;
  });
}

ListReleasesResponse AdminService::ListReleases(const ListReleasesRequest& req) {
  return Traced("AdminService.ListReleases", [&] {
    ListReleasesResponse resp;
    for (auto& release : ctx_.backend->ListReleases(req.namespace_())) {
      *resp.add_releases() = std::move(release);
    }
    return resp;
  });
}

GetReleaseResponse AdminService::GetRelease(const GetReleaseRequest& req) {
  return Traced("AdminService.GetRelease", [&] {
    const auto [release_namespace, name] = cache::SplitMetaNamespaceKey(req.key());

    auto release = ctx_.backend->GetRelease(release_namespace, name);
    if (!release) throw util::NotFound("release not found: " + req.key());

    GetReleaseResponse resp;
    *resp.mutable_release() = std::move(*release);
    for (auto& history : ctx_.backend->ListHistories(release_namespace, name)) {
      *resp.add_histories() = std::move(history);
    }
    return resp;
  });
}

} // namespace releasectl::service
