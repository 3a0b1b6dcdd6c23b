#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace recall::util {

/*
  Time utilities: the single place that controls the clock source.

  Scheduling code below the service layer never calls Now(); it receives
  "now" as an argument. Services hold a ClockFn so tests can pin time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;
using Day       = std::chrono::sys_days;

inline constexpr std::chrono::milliseconds kMillisPerDay = std::chrono::hours(24);

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Latest instant the clock can represent, in Unix milliseconds.
uint64_t MaxUnixMillis();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms); // clamps to MaxUnixMillis()

// ms + days, saturating at MaxUnixMillis().
uint64_t AddDaysSaturated(uint64_t ms, uint32_t days);

/*
  Calendar day boundaries at a fixed offset from UTC.

  "Today", streak days and daily summaries are all computed through one
  instance of this class so they agree on where a day starts.
*/
class CalendarDays {
 public:
  explicit CalendarDays(std::chrono::minutes utc_offset = std::chrono::minutes{0});

  Day       DayOf(TimePoint tp) const;
  TimePoint StartOf(Day day) const;
  TimePoint EndOf(Day day) const; // exclusive

  std::chrono::minutes UtcOffset() const {
    return utc_offset_;
  }

 private:
  std::chrono::minutes utc_offset_;
};

// YYYY-MM-DD
std::string FormatDate(Day day);
Day         ParseDate(const std::string& text);

} // namespace recall::util
