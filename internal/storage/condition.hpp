#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"
#include "releasectl/v1/release.pb.h"

namespace releasectl::storage {

/*
  Release lifecycle conditions.

  Every reconcile outcome maps to exactly one Reason, and every Reason maps
  to a fixed (type, status) pair:

    Creating | Updating | Rollbacking  -> Progressing / True
    Available                          -> Available   / True
    Failure                            -> Failure     / True
*/
enum class Reason {
  kCreating,
  kUpdating,
  kRollbacking,
  kAvailable,
  kFailure,
};

inline constexpr std::string_view kReasonCreating    = "Creating";
inline constexpr std::string_view kReasonUpdating    = "Updating";
inline constexpr std::string_view kReasonRollbacking = "Rollbacking";
inline constexpr std::string_view kReasonAvailable   = "Available";
inline constexpr std::string_view kReasonFailure     = "Failure";

std::string_view      ReasonName(Reason reason);
std::optional<Reason> ReasonFromName(std::string_view name);

constexpr v1::ConditionType ConditionTypeFor(Reason reason) {
  switch (reason) {
    case Reason::kCreating:
    case Reason::kUpdating:
    case Reason::kRollbacking:
      return v1::CONDITION_TYPE_PROGRESSING;
    case Reason::kAvailable:
      return v1::CONDITION_TYPE_AVAILABLE;
    case Reason::kFailure:
      return v1::CONDITION_TYPE_FAILURE;
  }
  return v1::CONDITION_TYPE_UNSPECIFIED;
}

v1::ReleaseCondition NewCondition(Reason reason, std::string message, util::TimePoint now = util::Now());

v1::ReleaseCondition ConditionCreating(util::TimePoint now = util::Now());
v1::ReleaseCondition ConditionUpdating(util::TimePoint now = util::Now());
v1::ReleaseCondition ConditionRollbacking(util::TimePoint now = util::Now());
v1::ReleaseCondition ConditionAvailable(util::TimePoint now = util::Now());
v1::ReleaseCondition ConditionFailure(std::string message, util::TimePoint now = util::Now());

// Replaces the lifecycle condition of status with condition. Progressing,
// Available and Failure are mutually exclusive, so the result carries
// exactly one of them.
void SetCondition(v1::ReleaseStatus* status, const v1::ReleaseCondition& condition);

// The current lifecycle condition, if any.
std::optional<v1::ReleaseCondition> LifecycleCondition(const v1::ReleaseStatus& status);

bool IsAvailable(const v1::ReleaseStatus& status);

} // namespace releasectl::storage
