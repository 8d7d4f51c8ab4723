// include/curdata/core/currency_code.hpp — Syntax and membership checks for ISO 4217 codes.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <curdata/core/error.hpp>
#include <curdata/core/registry.hpp>

namespace curdata::core {

inline constexpr std::size_t CURRENCY_CODE_LENGTH = 3;

// The only listed code allowed to carry a non-letter.
inline constexpr std::string_view LEGACY_NON_LETTER_CODE = "XB5";

constexpr bool is_well_formed_currency_code(std::string_view code) noexcept {
    if (code.size() != CURRENCY_CODE_LENGTH) {
        return false;
    }
    if (code == LEGACY_NON_LETTER_CODE) {
        return true;
    }
    for (const char ch : code) {
        if (ch < 'A' || ch > 'Z') {
            return false;
        }
    }
    return true;
}

inline status validate_currency_code(const currency_registry &registry, std::string_view code) {
    if (code.size() != CURRENCY_CODE_LENGTH) {
        return make_error(error_kind::invalid_currency_code_format,
                          "illegal length for currency code: " + std::string(code));
    }
    if (!is_well_formed_currency_code(code)) {
        return make_error(error_kind::invalid_currency_code_format,
                          "currency code contains illegal character: " + std::string(code));
    }
    if (!registry.lists(code)) {
        return make_error(error_kind::unknown_currency_code,
                          "currency code not listed as valid: " + std::string(code));
    }
    return ok_status();
}

} // namespace curdata::core
