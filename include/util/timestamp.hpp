#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tally::util {

// UTC instant at microsecond precision. Every UpdatedAt and watermark uses it.
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

// Calendar date without a time of day (transaction dates, due dates).
using Date = std::chrono::year_month_day;

inline constexpr Timestamp kEpoch{};
inline constexpr Date kEpochDate{std::chrono::year{1970}, std::chrono::January, std::chrono::day{1}};

Timestamp currentTimestamp();

inline std::int64_t toMicros(const Timestamp ts) { return ts.time_since_epoch().count(); }

inline Timestamp fromMicros(const std::int64_t us) { return Timestamp{std::chrono::microseconds{us}}; }

// ISO-8601 UTC, e.g. 2026-10-19T08:15:02.123456Z
std::string timestampToString(Timestamp ts);

// Accepts YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+00:00]. Throws std::invalid_argument.
Timestamp parseTimestamp(const std::string& iso);

std::string dateToString(const Date& d);

// Accepts YYYY-MM-DD, or an ISO timestamp whose date part is used.
Date parseDate(const std::string& s);

Date today();

}
