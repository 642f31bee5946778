#include "manifest_source.hpp"

#include <google/protobuf/util/message_differencer.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/cache/key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace releasectl::source {

using observability::IntField;
using observability::StringField;

namespace {

bool IsManifestFile(const std::filesystem::directory_entry& entry) {
  if (!entry.is_regular_file()) return false;
  const auto extension = entry.path().extension();
  return extension == ".yaml" || extension == ".yml";
}

std::string RequiredScalar(const YAML::Node& node, const char* field) {
  const auto value = node[field];
  if (!value || !value.IsScalar() || value.Scalar().empty()) {
    throw std::runtime_error(std::string("missing field: ") + field);
  }
  return value.Scalar();
}

std::string OptionalScalar(const YAML::Node& node, const char* field) {
  const auto value = node[field];
  if (!value || value.IsNull()) return {};
  if (!value.IsScalar()) throw std::runtime_error(std::string("field is not a scalar: ") + field);
  return value.Scalar();
}

void RejectUnknownFields(const YAML::Node& node, const std::set<std::string>& known, const std::string& where) {
  for (const auto& it : node) {
    const auto field = it.first.Scalar();
    if (!known.contains(field)) throw std::runtime_error("unknown field in " + where + ": " + field);
  }
}

} // namespace

v1::Release ParseReleaseManifest(const std::string& text) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("invalid YAML: " + std::string(e.what()));
  }
  if (!root.IsMap()) throw std::runtime_error("release manifest must be a map");
  RejectUnknownFields(root, {"namespace", "name", "spec"}, "release");

  v1::Release release;
  release.set_namespace_(RequiredScalar(root, "namespace"));
  release.set_name(RequiredScalar(root, "name"));
  if (!cache::IsValidName(release.namespace_())) throw std::runtime_error("invalid namespace: " + release.namespace_());
  if (!cache::IsValidName(release.name())) throw std::runtime_error("invalid name: " + release.name());

  const auto spec = root["spec"];
  if (!spec || spec.IsNull()) return release;
  if (!spec.IsMap()) throw std::runtime_error("spec must be a map");
  RejectUnknownFields(spec, {"description", "config", "template", "rollback_to"}, "spec");

  auto* out = release.mutable_spec();
  out->set_description(OptionalScalar(spec, "description"));
  out->set_config(OptionalScalar(spec, "config"));
  out->set_template_(OptionalScalar(spec, "template"));

  if (const auto rollback = spec["rollback_to"]; rollback && !rollback.IsNull()) {
    int version = 0;
    try {
      version = rollback.as<int>();
    } catch (const YAML::Exception&) {
      throw std::runtime_error("rollback_to must be an integer");
    }
    if (version < 0) throw std::runtime_error("rollback_to must not be negative");
    if (version > 0) out->mutable_rollback_to()->set_version(version);
  }
  return release;
}

ManifestSource::ManifestSource(std::filesystem::path dir, std::shared_ptr<storage::ReleaseBackend> backend,
                               std::chrono::milliseconds poll_interval)
    : dir_(std::move(dir)), backend_(std::move(backend)), poll_interval_(poll_interval) {
}

ManifestSource::~ManifestSource() {
  Stop();
}

void ManifestSource::Start() {
  RELEASECTL_LOG_INFO("Watching manifest directory", {StringField("dir", dir_.string()), IntField("poll_interval_ms", poll_interval_.count())});
  Poll();

  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread([this] { PollLoop(); });
}

void ManifestSource::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ManifestSource::PollLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, poll_interval_, [this] { return stopping_; })) break;

    lock.unlock();
    try {
      Poll();
    } catch (const std::exception& e) {
      RELEASECTL_LOG_ERROR("Manifest poll failed", {StringField("dir", dir_.string()), StringField("error", e.what())});
    }
    lock.lock();
  }
}

std::size_t ManifestSource::Poll() {
  std::lock_guard<std::mutex> lock(poll_mutex_);

  std::map<std::string, FileState> current;
  std::vector<std::filesystem::path> changed;

  std::error_code ec;
  if (std::filesystem::is_directory(dir_, ec)) {
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
      if (!IsManifestFile(entry)) continue;

      FileState state;
      state.mtime = entry.last_write_time(ec).time_since_epoch().count();
      state.size  = entry.file_size(ec);

      const auto key = entry.path().generic_string();
      auto       it  = files_.find(key);
      if (it != files_.end()) state.release = it->second.release;
      if (it == files_.end() || it->second.mtime != state.mtime || it->second.size != state.size) {
        changed.push_back(entry.path());
      }
      current.emplace(key, std::move(state));
    }
  } else {
    RELEASECTL_LOG_WARN("Manifest directory is missing", {StringField("dir", dir_.string())});
  }

  std::size_t writes = 0;
  for (const auto& [path, state] : files_) {
    if (!current.contains(path)) writes += Remove(path, state);
  }
  for (const auto& path : changed) {
    writes += Apply(path, &current[path.generic_string()]);
  }

  files_.swap(current);
  return writes;
}

std::size_t ManifestSource::Apply(const std::filesystem::path& path, FileState* state) {
  const auto previous = state->release;

  v1::Release release;
  try {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("can't open file");
    std::stringstream buffer;
    buffer << in.rdbuf();
    release = ParseReleaseManifest(buffer.str());
  } catch (const std::exception& e) {
    // The release last read from this file stays live until the file parses again or is removed.
    RELEASECTL_LOG_ERROR("Can't parse release manifest", {StringField("file", path.string()), StringField("error", e.what())});
    return 0;
  }

  state->release.reset();

  std::size_t writes = 0;
  const auto  target = std::make_pair(release.namespace_(), release.name());

  // The file was repointed at another release.
  if (previous && *previous != target) {
    writes += Remove(path.generic_string(), FileState{0, 0, previous});
  }

  try {
    auto existing = backend_->GetRelease(target.first, target.second);
    if (!existing) {
      backend_->CreateRelease(release);
      ++writes;
      RELEASECTL_LOG_INFO("Release created from manifest", {StringField("file", path.string()), StringField("release", cache::MetaNamespaceKeyFunc(release))});
    } else if (!google::protobuf::util::MessageDifferencer::Equals(existing->spec(), release.spec())) {
      backend_->UpdateRelease(release);
      ++writes;
      RELEASECTL_LOG_INFO("Release updated from manifest", {StringField("file", path.string()), StringField("release", cache::MetaNamespaceKeyFunc(release))});
    }
  } catch (const std::exception& e) {
    RELEASECTL_LOG_ERROR("Can't apply release manifest", {StringField("file", path.string()), StringField("error", e.what())});
    return writes;
  }

  state->release = target;
  return writes;
}

std::size_t ManifestSource::Remove(const std::string& path, const FileState& state) {
  if (!state.release) return 0;

  const auto& [release_namespace, name] = *state.release;
  try {
    backend_->DeleteRelease(release_namespace, name);
  } catch (const util::NotFound&) {
    return 0;
  } catch (const std::exception& e) {
    RELEASECTL_LOG_ERROR("Can't delete release", {StringField("file", path), StringField("error", e.what())});
    return 0;
  }

  RELEASECTL_LOG_INFO("Release deleted with its manifest", {StringField("file", path), StringField("namespace", release_namespace), StringField("name", name)});
  return 1;
}

} // namespace releasectl::source
