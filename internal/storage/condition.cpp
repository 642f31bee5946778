#include "condition.hpp"

#include <utility>

namespace releasectl::storage {

namespace {

bool IsLifecycleType(v1::ConditionType type) {
  return type == v1::CONDITION_TYPE_PROGRESSING || type == v1::CONDITION_TYPE_AVAILABLE || type == v1::CONDITION_TYPE_FAILURE;
}

} // namespace

std::string_view ReasonName(Reason reason) {
  switch (reason) {
    case Reason::kCreating:
      return kReasonCreating;
    case Reason::kUpdating:
      return kReasonUpdating;
    case Reason::kRollbacking:
      return kReasonRollbacking;
    case Reason::kAvailable:
      return kReasonAvailable;
    case Reason::kFailure:
      return kReasonFailure;
  }
  return {};
}

std::optional<Reason> ReasonFromName(std::string_view name) {
  if (name == kReasonCreating) return Reason::kCreating;
  if (name == kReasonUpdating) return Reason::kUpdating;
  if (name == kReasonRollbacking) return Reason::kRollbacking;
  if (name == kReasonAvailable) return Reason::kAvailable;
  if (name == kReasonFailure) return Reason::kFailure;
  return std::nullopt;
}

v1::ReleaseCondition NewCondition(Reason reason, std::string message, util::TimePoint now) {
  v1::ReleaseCondition condition;
  condition.set_type(ConditionTypeFor(reason));
  condition.set_status(v1::CONDITION_STATUS_TRUE);
  condition.set_reason(std::string(ReasonName(reason)));
  condition.set_message(std::move(message));
  *condition.mutable_last_transition_time() = util::ToProto(now);
  return condition;
}

v1::ReleaseCondition ConditionCreating(util::TimePoint now) {
  return NewCondition(Reason::kCreating, "", now);
}

v1::ReleaseCondition ConditionUpdating(util::TimePoint now) {
  return NewCondition(Reason::kUpdating, "", now);
}

v1::ReleaseCondition ConditionRollbacking(util::TimePoint now) {
  return NewCondition(Reason::kRollbacking, "", now);
}

v1::ReleaseCondition ConditionAvailable(util::TimePoint now) {
  return NewCondition(Reason::kAvailable, "", now);
}

v1::ReleaseCondition ConditionFailure(std::string message, util::TimePoint now) {
  return NewCondition(Reason::kFailure, std::move(message), now);
}

void SetCondition(v1::ReleaseStatus* status, const v1::ReleaseCondition& condition) {
  auto* conditions = status->mutable_conditions();

  for (int i = conditions->size() - 1; i >= 0; --i) {
    const auto type = conditions->Get(i).type();
    if (type == condition.type() || (IsLifecycleType(condition.type()) && IsLifecycleType(type))) {
      conditions->DeleteSubrange(i, 1);
    }
  }

  *conditions->Add() = condition;
}

std::optional<v1::ReleaseCondition> LifecycleCondition(const v1::ReleaseStatus& status) {
  for (int i = status.conditions_size() - 1; i >= 0; --i) {
    if (IsLifecycleType(status.conditions(i).type())) {
      return status.conditions(i);
    }
  }
  return std::nullopt;
}

bool IsAvailable(const v1::ReleaseStatus& status) {
  auto condition = LifecycleCondition(status);
  return condition && condition->type() == v1::CONDITION_TYPE_AVAILABLE && condition->status() == v1::CONDITION_STATUS_TRUE;
}

} // namespace releasectl::storage
