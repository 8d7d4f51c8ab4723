// include/curdata/core/currency_info.hpp — A validated currency code with its resolved attributes.

#pragma once

#include <string>
#include <string_view>

#include <curdata/core/currency_code.hpp>
#include <curdata/core/error.hpp>
#include <curdata/core/fraction_digits.hpp>
#include <curdata/core/numeric_code.hpp>
#include <curdata/core/registry.hpp>

namespace curdata::core {

struct currency_info {
    std::string code;
    int fraction_digits = 0;
    int numeric_code = 0;

    bool operator==(const currency_info &) const = default;
};

inline result<currency_info> describe_currency(const currency_registry &registry, std::string_view code) {
    if (auto checked = validate_currency_code(registry, code); !checked) {
        return checked.failure();
    }
    auto numeric = resolve_numeric_code(registry, code);
    if (!numeric) {
        return numeric.failure();
    }
    currency_info info;
    info.code = std::string(code);
    info.fraction_digits = resolve_fraction_digits(registry, code);
    info.numeric_code = numeric.value();
    return info;
}

} // namespace curdata::core
