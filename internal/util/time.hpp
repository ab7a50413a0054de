#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace booking::util {

/*
  Time utilities. Single place to control the clock source.

  Calendar dates are provider-local. A provider's zone is a fixed
  offset from UTC in minutes.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// "YYYY-MM-DD". Throws ValidationError on malformed or impossible dates.
Date        ParseDate(std::string_view value);
std::string FormatDate(Date date);

// "HH:MM" <-> minutes from midnight. "24:00" is accepted as end of day.
uint32_t    ParseMinuteOfDay(std::string_view value);
std::string FormatMinuteOfDay(uint32_t minute);

// 0 = Sunday .. 6 = Saturday.
unsigned DayOfWeek(Date date);

Date AddDays(Date date, int days);

// Signed day distance (to - from).
int DaysBetween(Date from, Date to);

TimePoint LocalToInstant(Date date, uint32_t minute_of_day, int32_t utc_offset_minutes);

// Provider-local calendar date of an instant.
Date LocalDateOf(TimePoint tp, int32_t utc_offset_minutes);

} // namespace booking::util
