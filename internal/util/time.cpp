#include "time.hpp"

#include <charconv>
#include <cstdio>

#include "internal/util/errors.hpp"

namespace booking::util {

namespace {

int ParseDigits(std::string_view value, std::string_view what) {
  int        result = 0;
  const auto* end   = value.data() + value.size();
  auto [ptr, ec]    = std::from_chars(value.data(), end, result);
  if (ec != std::errc{} || ptr != end) {
    throw ValidationError("invalid " + std::string(what) + ": '" + std::string(value) + "'");
  }
  return result;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

Date ParseDate(std::string_view value) {
  if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
    throw ValidationError("invalid date: '" + std::string(value) + "', expected YYYY-MM-DD");
  }

  const Date date{std::chrono::year{ParseDigits(value.substr(0, 4), "year")},
                  std::chrono::month{static_cast<unsigned>(ParseDigits(value.substr(5, 2), "month"))},
                  std::chrono::day{static_cast<unsigned>(ParseDigits(value.substr(8, 2), "day"))}};
  if (!date.ok()) {
    throw ValidationError("invalid date: '" + std::string(value) + "'");
  }
  return date;
}

std::string FormatDate(Date date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

uint32_t ParseMinuteOfDay(std::string_view value) {
  const auto colon = value.find(':');
  if (colon == std::string_view::npos) {
    throw ValidationError("invalid time of day: '" + std::string(value) + "', expected HH:MM");
  }

  const int hours   = ParseDigits(value.substr(0, colon), "hour");
  const int minutes = ParseDigits(value.substr(colon + 1), "minute");
  if (hours < 0 || minutes < 0 || minutes > 59 || hours > 24 || (hours == 24 && minutes != 0)) {
    throw ValidationError("invalid time of day: '" + std::string(value) + "'");
  }
  return static_cast<uint32_t>(hours * 60 + minutes);
}

std::string FormatMinuteOfDay(uint32_t minute) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02u:%02u", minute / 60, minute % 60);
  return buf;
}

unsigned DayOfWeek(Date date) {
  return std::chrono::weekday{std::chrono::sys_days{date}}.c_encoding();
}

Date AddDays(Date date, int days) {
  return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

int DaysBetween(Date from, Date to) {
  return static_cast<int>((std::chrono::sys_days{to} - std::chrono::sys_days{from}).count());
}

TimePoint LocalToInstant(Date date, uint32_t minute_of_day, int32_t utc_offset_minutes) {
  const auto local = std::chrono::sys_days{date} + std::chrono::minutes{minute_of_day};
  return TimePoint{std::chrono::time_point_cast<Clock::duration>(local - std::chrono::minutes{utc_offset_minutes})};
}

Date LocalDateOf(TimePoint tp, int32_t utc_offset_minutes) {
  const auto local = tp + std::chrono::minutes{utc_offset_minutes};
  return Date{std::chrono::floor<std::chrono::days>(local)};
}

} // namespace booking::util
