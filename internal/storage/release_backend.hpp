#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "releasectl/v1/release.pb.h"

namespace releasectl::storage {

enum class EventType {
  kAdded,
  kModified,
  kDeleted,
};

struct WatchEvent {
  EventType   type = EventType::kAdded;
  v1::Release object;
};

using WatchHandler = std::function<void(const WatchEvent&)>;

struct ListWatchResult {
  std::vector<v1::Release> items;
  std::uint64_t            watch_id = 0;
};

/*
  Release backend abstraction.

  The backend is the source of truth for releases and their histories.

  GUARANTEES:

  - Every write bumps the object's resource_version
  - Watch events are delivered in write order
  - ListAndWatch is atomic: no write falls between the list and the
    first delivered event
  - Watch handlers run on the writer's thread after the write is visible;
    they may read the backend but must not write to it

  Errors are reported with util::NotFound / AlreadyExists / Conflict.
*/
class ReleaseBackend {
 public:
  virtual ~ReleaseBackend() = default;

  // ---------------------------------------------------------------------
  // Releases
  // ---------------------------------------------------------------------

  virtual std::optional<v1::Release> GetRelease(const std::string& release_namespace, const std::string& name) = 0;

  // Empty namespace lists every namespace.
  virtual std::vector<v1::Release> ListReleases(const std::string& release_namespace) = 0;

  virtual v1::Release CreateRelease(const v1::Release& release) = 0;

  // Replaces the spec. A non-zero resource_version must match the stored one.
  virtual v1::Release UpdateRelease(const v1::Release& release) = 0;

  virtual v1::Release UpdateReleaseStatus(const std::string& release_namespace, const std::string& name, const v1::ReleaseStatus& status) = 0;

  virtual void DeleteRelease(const std::string& release_namespace, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Release histories
  // ---------------------------------------------------------------------

  virtual void CreateHistory(const v1::ReleaseHistory& history) = 0;

  // Sorted by ascending version.
  virtual std::vector<v1::ReleaseHistory> ListHistories(const std::string& release_namespace, const std::string& name) = 0;

  virtual std::vector<v1::ReleaseHistory> ListAllHistories() = 0;

  virtual void DeleteHistories(const std::string& release_namespace, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Watch
  // ---------------------------------------------------------------------

  virtual ListWatchResult ListAndWatch(WatchHandler handler) = 0;

  virtual void StopWatch(std::uint64_t watch_id) = 0;
};

} // namespace releasectl::storage
