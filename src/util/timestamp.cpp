#include "util/timestamp.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <fmt/format.h>

using namespace std::chrono;

namespace tally::util {

namespace {

int readInt(const std::string& s, size_t pos, size_t len, const char* what) {
    if (pos + len > s.size()) throw std::invalid_argument(std::string("Truncated ") + what + ": " + s);
    int value = 0;
    const auto* first = s.data() + pos;
    const auto [ptr, ec] = std::from_chars(first, first + len, value);
    if (ec != std::errc() || ptr != first + len)
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + s);
    return value;
}

void expect(const std::string& s, const size_t pos, const char c) {
    if (pos >= s.size() || s[pos] != c)
        throw std::invalid_argument("Malformed timestamp: " + s);
}

}

Timestamp currentTimestamp() {
    return floor<microseconds>(system_clock::now());
}

std::string timestampToString(const Timestamp ts) {
    const auto day = floor<days>(ts);
    const year_month_day ymd{day};
    const hh_mm_ss tod{ts - day};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                       static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()), tod.hours().count(), tod.minutes().count(),
                       tod.seconds().count(), tod.subseconds().count());
}

Timestamp parseTimestamp(const std::string& iso) {
    const Date d = parseDate(iso.substr(0, 10));
    expect(iso, 10, 'T');

    const int hh = readInt(iso, 11, 2, "hour");
    expect(iso, 13, ':');
    const int mm = readInt(iso, 14, 2, "minute");
    expect(iso, 16, ':');
    const int ss = readInt(iso, 17, 2, "second");
    if (hh > 23 || mm > 59 || ss > 60) throw std::invalid_argument("Time out of range: " + iso);

    size_t pos = 19;
    std::int64_t frac = 0;
    if (pos < iso.size() && iso[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) {
            // anything past microseconds is truncated
            if (digits < 6) {
                frac = frac * 10 + (iso[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) throw std::invalid_argument("Empty fraction: " + iso);
        for (; digits < 6; ++digits) frac *= 10;
    }

    const auto rest = iso.substr(pos);
    if (!rest.empty() && rest != "Z" && rest != "+00:00")
        throw std::invalid_argument("Only UTC timestamps are accepted: " + iso);

    return Timestamp{sys_days{d}.time_since_epoch()} + hours{hh} + minutes{mm} + seconds{ss}
           + microseconds{frac};
}

std::string dateToString(const Date& d) {
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(d.year()),
                       static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
}

Date parseDate(const std::string& s) {
    const int y = readInt(s, 0, 4, "year");
    expect(s, 4, '-');
    const int m = readInt(s, 5, 2, "month");
    expect(s, 7, '-');
    const int d = readInt(s, 8, 2, "day");

    const Date date{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!date.ok()) throw std::invalid_argument("Invalid calendar date: " + s);
    return date;
}

Date today() {
    return Date{floor<days>(system_clock::now())};
}

}
