#include "manager.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <set>
#include <unordered_set>

#include "internal/cache/key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace releasectl::release {

using observability::IntField;
using observability::StringField;
using storage::Reason;

namespace {

bool SpecEqual(const v1::ReleaseSpec& a, const v1::ReleaseSpec& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace

Manager::Manager(std::shared_ptr<storage::ReleaseBackend> backend, std::shared_ptr<render::Renderer> renderer,
                 std::shared_ptr<resources::ResourceClient> client)
    : backend_(std::move(backend)), renderer_(std::move(renderer)), client_(std::move(client)) {
}

// ------------------------------------------------------------
// Trigger
// ------------------------------------------------------------

std::optional<Manager::Plan> Manager::Decide(const v1::Release& release, const std::vector<v1::ReleaseHistory>& histories) {
  const v1::ReleaseHistory* latest = histories.empty() ? nullptr : &histories.back();
  const int32_t             next   = latest ? latest->version() + 1 : 1;

  Plan plan;

  if (release.spec().rollback_to().version() > 0) {
    const auto target_version = release.spec().rollback_to().version();
    plan.reason               = Reason::kRollbacking;
    plan.rollback_to          = target_version;

    // A spec that still asks for the rollback that produced the applied
    // version, e.g. a manifest file re-read after a restart.
    if (latest && release.status().rolled_back_to() == target_version && release.status().version() == latest->version() &&
        storage::IsAvailable(release.status())) {
      plan.spec = latest->spec();
      plan.spec.clear_rollback_to();
      plan.version     = latest->version();
      plan.new_history = false;
      plan.spec_only   = true;
      return plan;
    }

    auto target = std::find_if(histories.begin(), histories.end(),
                               [&](const v1::ReleaseHistory& h) { return h.version() == target_version; });
    if (target == histories.end()) {
      throw util::NotFound("rollback target version " + std::to_string(target_version) + " does not exist");
    }

    plan.spec = target->spec();
    plan.spec.clear_rollback_to();
    plan.version = next;
    return plan;
  }

  if (!latest) {
    plan.reason  = Reason::kCreating;
    plan.spec    = release.spec();
    plan.version = next;
    return plan;
  }

  if (!SpecEqual(latest->spec(), release.spec())) {
    plan.reason  = Reason::kUpdating;
    plan.spec    = release.spec();
    plan.version = next;
    return plan;
  }

  if (release.status().version() == latest->version() && storage::IsAvailable(release.status())) {
    return std::nullopt;
  }

  // Spec already recorded but never confirmed available: a previous attempt
  // failed or was interrupted. Re-apply the recorded version.
  plan.reason      = release.status().version() == 0 ? Reason::kCreating : Reason::kUpdating;
  plan.spec        = latest->spec();
  plan.version     = latest->version();
  plan.new_history = false;
  return plan;
}

void Manager::Trigger(const v1::Release& release) {
  observability::SpanScope span("ReleaseManager.Trigger");
  span.SetAttribute("release", release.namespace_() + "/" + release.name());

  // Act on the freshest copy; the cached one may predate our own writes.
  auto current = backend_->GetRelease(release.namespace_(), release.name());
  if (!current) {
    RELEASECTL_LOG_DEBUG("Release vanished before trigger", {StringField("namespace", release.namespace_()), StringField("name", release.name())});
    return;
  }

  std::optional<Plan> plan;
  try {
    plan = Decide(*current, backend_->ListHistories(current->namespace_(), current->name()));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    RecordFailure(*current, e.what());
    throw util::ConvergenceError(e.what());
  }

  if (!plan) {
    RELEASECTL_LOG_DEBUG("Release up to date", {StringField("namespace", current->namespace_()), StringField("name", current->name()),
                                                IntField("version", current->status().version())});
    return;
  }

  try {
    Execute(*current, *plan);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    RecordFailure(*current, e.what());
    throw util::ConvergenceError(e.what());
  }
}

void Manager::Execute(const v1::Release& release, const Plan& plan) {
  const auto& ns    = release.namespace_();
  const auto& name  = release.name();
  const auto  owner = cache::MetaNamespaceKey(ns, name);

  if (plan.spec_only) {
    v1::Release restored     = release;
    *restored.mutable_spec() = plan.spec;
    backend_->UpdateRelease(restored);
    RELEASECTL_LOG_INFO("Rollback already applied", {StringField("release", owner), IntField("version", plan.version),
                                                     IntField("rollback_to", plan.rollback_to)});
    return;
  }

  RELEASECTL_LOG_INFO("Reconciling release", {StringField("release", owner), StringField("reason", storage::ReasonName(plan.reason)),
                                              IntField("version", plan.version)});

  v1::ReleaseStatus status = release.status();
  storage::SetCondition(&status, storage::NewCondition(plan.reason, ""));
  const auto progressing = backend_->UpdateReleaseStatus(ns, name, status);

  const auto rendered = renderer_->Render(ns, name, plan.spec);
  const auto manifest = render::JoinManifest(rendered);
  ApplyResources(owner, rendered);

  if (plan.new_history) {
    v1::ReleaseHistory history;
    history.set_namespace_(ns);
    history.set_name(name);
    history.set_version(plan.version);
    *history.mutable_spec()        = plan.spec;
    history.set_manifest(manifest);
    *history.mutable_create_time() = util::ToProto(util::Now());
    backend_->CreateHistory(history);
  }

  if (plan.reason == Reason::kRollbacking) {
    // Conflicts if the spec was edited since the status write; the retry
    // then reconciles the newer spec instead.
    v1::Release rolled_back     = progressing;
    *rolled_back.mutable_spec() = plan.spec;
    backend_->UpdateRelease(rolled_back);
  }

  status.set_version(plan.version);
  status.set_manifest(manifest);
  status.set_rolled_back_to(plan.reason == Reason::kRollbacking ? plan.rollback_to : 0);
  storage::SetCondition(&status, storage::ConditionAvailable());
  backend_->UpdateReleaseStatus(ns, name, status);

  RELEASECTL_LOG_INFO("Release available", {StringField("release", owner), IntField("version", plan.version),
                                            IntField("resources", static_cast<std::int64_t>(rendered.size()))});
}

void Manager::ApplyResources(const std::string& owner, const std::vector<resources::Resource>& rendered) {
  std::set<std::string> wanted;
  for (const auto& resource : rendered) {
    wanted.insert(resources::ResourceID(resource));
    client_->Apply(resource);
  }

  // Drop whatever the previous manifest had and this one does not.
  for (const auto& existing : client_->ListByOwner(owner)) {
    if (!wanted.contains(resources::ResourceID(existing))) {
      client_->Delete(existing);
    }
  }
}

void Manager::RecordFailure(const v1::Release& release, const std::string& message) {
  v1::ReleaseStatus status = release.status();
  storage::SetCondition(&status, storage::ConditionFailure(message));
  try {
    backend_->UpdateReleaseStatus(release.namespace_(), release.name(), status);
  } catch (const std::exception& e) {
    RELEASECTL_LOG_WARN("Can't record release failure", {StringField("namespace", release.namespace_()), StringField("name", release.name()),
                                                         StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void Manager::Delete(const std::string& release_namespace, const std::string& name) {
  observability::SpanScope span("ReleaseManager.Delete");

  try {
    const auto owner = cache::MetaNamespaceKey(release_namespace, name);
    span.SetAttribute("release", owner);

    std::int64_t removed = 0;
    for (const auto& resource : client_->ListByOwner(owner)) {
      if (client_->Delete(resource)) ++removed;
    }
    backend_->DeleteHistories(release_namespace, name);

    if (removed > 0) {
      RELEASECTL_LOG_INFO("Deleted release resources", {StringField("release", owner), IntField("resources", removed)});
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::ConvergenceError(e.what());
  }
}

// ------------------------------------------------------------
// Run
// ------------------------------------------------------------

void Manager::Run() {
  observability::SpanScope span("ReleaseManager.Run");

  // Owners and histories are listed before releases: both are only ever
  // written after their release exists, so a release created in between
  // cannot be mistaken for garbage.
  const auto owners    = client_->ListOwners();
  const auto histories = backend_->ListAllHistories();
  const auto live      = backend_->ListReleases("");

  std::unordered_set<std::string> live_keys;
  for (const auto& release : live) {
    live_keys.insert(cache::MetaNamespaceKey(release.namespace_(), release.name()));
  }

  std::int64_t repaired = 0;
  for (const auto& owner : owners) {
    if (live_keys.contains(owner)) continue;

    auto [ns, name] = cache::SplitMetaNamespaceKey(owner);
    RELEASECTL_LOG_WARN("Removing resources of deleted release", {StringField("release", owner)});
    Delete(ns, name);
    ++repaired;
  }

  std::set<std::string> orphaned_histories;
  for (const auto& history : histories) {
    const auto key = cache::MetaNamespaceKey(history.namespace_(), history.name());
    if (!live_keys.contains(key)) orphaned_histories.insert(key);
  }
  for (const auto& key : orphaned_histories) {
    auto [ns, name] = cache::SplitMetaNamespaceKey(key);
    backend_->DeleteHistories(ns, name);
    ++repaired;
  }

  if (repaired > 0) {
    RELEASECTL_LOG_INFO("Consistency sweep repaired releases", {IntField("repaired", repaired)});
  }
}

} // namespace releasectl::release
