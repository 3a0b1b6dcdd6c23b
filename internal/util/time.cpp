#include "time.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace recall::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

uint64_t MaxUnixMillis() {
  return ToUnixMillis(std::chrono::floor<std::chrono::milliseconds>(TimePoint::max()));
}

TimePoint FromUnixMillis(uint64_t ms) {
  ms = std::min(ms, MaxUnixMillis());
  return TimePoint{} + std::chrono::milliseconds(static_cast<int64_t>(ms));
}

uint64_t AddDaysSaturated(uint64_t ms, uint32_t days) {
  const uint64_t limit = MaxUnixMillis();
  const uint64_t span  = static_cast<uint64_t>(days) * static_cast<uint64_t>(kMillisPerDay.count());
  if (ms >= limit || span > limit - ms) {
    return limit;
  }
  return ms + span;
}

CalendarDays::CalendarDays(std::chrono::minutes utc_offset) : utc_offset_(utc_offset) {
}

Day CalendarDays::DayOf(TimePoint tp) const {
  return std::chrono::floor<std::chrono::days>(tp + utc_offset_);
}

TimePoint CalendarDays::StartOf(Day day) const {
  return TimePoint(day) - utc_offset_;
}

TimePoint CalendarDays::EndOf(Day day) const {
  return StartOf(day + std::chrono::days(1));
}

std::string FormatDate(Day day) {
  const std::chrono::year_month_day ymd{day};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

Day ParseDate(const std::string& text) {
  const auto invalid = [&text]() { return InvalidArgument("invalid date '" + text + "': expected YYYY-MM-DD"); };

  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    throw invalid();
  }
  for (size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw invalid();
    }
  }

  const int      year  = std::stoi(text.substr(0, 4));
  const unsigned month = static_cast<unsigned>(std::stoul(text.substr(5, 2)));
  const unsigned day   = static_cast<unsigned>(std::stoul(text.substr(8, 2)));

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
  if (!ymd.ok()) {
    throw invalid();
  }
  return Day{ymd};
}

} // namespace recall::util
