// include/curdata/core/cut_over_time.hpp — UTC cut-over instants for currency transitions.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <curdata/core/error.hpp>

namespace curdata::core {

inline constexpr std::int64_t MILLIS_PER_SECOND = 1000;
inline constexpr std::int64_t MILLIS_PER_DAY = 24LL * 60 * 60 * MILLIS_PER_SECOND;

// A hundred years of 365 days.
inline constexpr std::int64_t DEFAULT_SANITY_WINDOW_MS = 100LL * 365 * MILLIS_PER_DAY;

// Length of "yyyy-MM-dd-HH-mm-ss".
inline constexpr std::size_t CUT_OVER_TIME_LENGTH = 19;

struct utc_fields {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

constexpr bool is_leap_year(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

constexpr int days_in_month(int year, int month) noexcept {
    constexpr int lengths[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[month - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
constexpr std::int64_t days_from_civil(int year, int month, int day) noexcept {
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t year_of_era = y - era * 400;
    const std::int64_t shifted_month = month > 2 ? month - 3 : month + 9;
    const std::int64_t day_of_year = (153 * shifted_month + 2) / 5 + day - 1;
    const std::int64_t day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * 146097 + day_of_era - 719468;
}

utc_fields civil_from_millis(std::int64_t epoch_ms) noexcept;

std::int64_t millis_from_civil(const utc_fields &fields) noexcept;

// Strict "yyyy-MM-dd-HH-mm-ss" in UTC; fields are range checked.
result<std::int64_t> parse_cut_over_time(std::string_view text);

std::string format_cut_over_time(std::int64_t epoch_ms);

status check_sanity_window(std::int64_t epoch_ms, std::int64_t now_ms,
                           std::int64_t window_ms = DEFAULT_SANITY_WINDOW_MS);

} // namespace curdata::core
