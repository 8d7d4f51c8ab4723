#include <curdata/core/cut_over_time.hpp>
#include <curdata/format.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace curdata::core {

namespace {

constexpr std::array<std::size_t, 6> FIELD_WIDTHS = {4, 2, 2, 2, 2, 2};

bool read_field(std::string_view text, std::size_t &cursor, std::size_t width, int &out) {
    if (cursor + width > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t offset = 0; offset < width; ++offset) {
        const char ch = text[cursor + offset];
        if (ch < '0' || ch > '9') {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    cursor += width;
    out = value;
    return true;
}

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) noexcept {
    std::int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

} // namespace

utc_fields civil_from_millis(std::int64_t epoch_ms) noexcept {
    const std::int64_t days = floor_div(epoch_ms, MILLIS_PER_DAY);
    const std::int64_t millis_of_day = epoch_ms - days * MILLIS_PER_DAY;

    const std::int64_t z = days + 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t day_of_era = z - era * 146097;
    const std::int64_t year_of_era =
        (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
    const std::int64_t day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
    const std::int64_t shifted_month = (5 * day_of_year + 2) / 153;

    utc_fields fields;
    fields.day = static_cast<int>(day_of_year - (153 * shifted_month + 2) / 5 + 1);
    fields.month = static_cast<int>(shifted_month < 10 ? shifted_month + 3 : shifted_month - 9);
    fields.year = static_cast<int>(year_of_era + era * 400 + (fields.month <= 2 ? 1 : 0));
    const std::int64_t seconds_of_day = millis_of_day / MILLIS_PER_SECOND;
    fields.hour = static_cast<int>(seconds_of_day / 3600);
    fields.minute = static_cast<int>((seconds_of_day / 60) % 60);
    fields.second = static_cast<int>(seconds_of_day % 60);
    return fields;
}

std::int64_t millis_from_civil(const utc_fields &fields) noexcept {
    const std::int64_t days = days_from_civil(fields.year, fields.month, fields.day);
    const std::int64_t seconds = static_cast<std::int64_t>(fields.hour) * 3600 +
                                 static_cast<std::int64_t>(fields.minute) * 60 + fields.second;
    return days * MILLIS_PER_DAY + seconds * MILLIS_PER_SECOND;
}

result<std::int64_t> parse_cut_over_time(std::string_view text) {
    const auto malformed = [text]() {
        return make_error(error_kind::malformed_special_case_string,
                          "unparseable cut-over time: \"" + std::string(text) + "\"");
    };
    if (text.size() != CUT_OVER_TIME_LENGTH) {
        return malformed();
    }
    std::array<int, FIELD_WIDTHS.size()> values{};
    std::size_t cursor = 0;
    for (std::size_t index = 0; index < FIELD_WIDTHS.size(); ++index) {
        if (index > 0) {
            if (text[cursor] != '-') {
                return malformed();
            }
            ++cursor;
        }
        if (!read_field(text, cursor, FIELD_WIDTHS[index], values[index])) {
            return malformed();
        }
    }

    utc_fields fields;
    fields.year = values[0];
    fields.month = values[1];
    fields.day = values[2];
    fields.hour = values[3];
    fields.minute = values[4];
    fields.second = values[5];
    if (fields.month < 1 || fields.month > 12 || fields.day < 1 ||
        fields.day > days_in_month(fields.year, fields.month) || fields.hour > 23 ||
        fields.minute > 59 || fields.second > 59) {
        return malformed();
    }
    return millis_from_civil(fields);
}

std::string format_cut_over_time(std::int64_t epoch_ms) {
    if (epoch_ms == format::NEVER_CUT_OVER) {
        return "never";
    }
    const utc_fields fields = civil_from_millis(epoch_ms);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d-%02d-%02d-%02d", fields.year, fields.month,
                  fields.day, fields.hour, fields.minute, fields.second);
    return buffer;
}

status check_sanity_window(std::int64_t epoch_ms, std::int64_t now_ms, std::int64_t window_ms) {
    const std::int64_t distance = epoch_ms >= now_ms ? epoch_ms - now_ms : now_ms - epoch_ms;
    if (distance > window_ms) {
        return make_error(error_kind::cut_over_time_out_of_sanity_window,
                          "cut-over time too far from present: " + format_cut_over_time(epoch_ms) + " (" +
                              std::to_string(epoch_ms) + " ms)");
    }
    return ok_status();
}

} // namespace curdata::core
