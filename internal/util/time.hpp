#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace releasectl::util {

/*
  Time utilities. Single place to control clock source.

  Now() reads the process clock, which tests may replace with SetClock()
  to keep condition timestamps deterministic.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

// Installs a clock override; an empty function restores the system clock.
void SetClock(ClockFn clock);

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace releasectl::util
