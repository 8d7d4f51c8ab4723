// include/curdata/core/numeric_code.hpp — ISO 4217 numeric codes read from the registry records.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <curdata/core/error.hpp>
#include <curdata/core/registry.hpp>

namespace curdata::core {

namespace detail {

// Parses exactly three decimal digits.
constexpr int parse_three_digits(std::string_view text) noexcept {
    if (text.size() != 3) {
        return -1;
    }
    int value = 0;
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return -1;
        }
        value = value * 10 + (ch - '0');
    }
    return value;
}

} // namespace detail

// The code must already have passed validate_currency_code.
inline result<int> resolve_numeric_code(const currency_registry &registry, std::string_view code) {
    const std::size_t position = registry.all.find(code);
    if (position == std::string::npos) {
        return make_error(error_kind::unknown_currency_code,
                          "currency code not listed as valid: " + std::string(code));
    }
    const std::size_t digits_at = position + code.size();
    const std::string_view digits = std::string_view(registry.all).substr(digits_at, 3);
    const int value = detail::parse_three_digits(digits);
    if (value < 0) {
        return make_error(error_kind::malformed_registry_string,
                          "no numeric code after " + std::string(code) + " in \"all\" entry");
    }
    return value;
}

} // namespace curdata::core
