// include/curdata/core/fraction_digits.hpp — Default minor unit digits per currency.

#pragma once

#include <string>
#include <string_view>

#include <curdata/core/registry.hpp>
#include <curdata/format.hpp>

namespace curdata::core {

// Returns 0, 1, 2, 3, or UNDEFINED_FRACTION_DIGITS (-1).
inline int resolve_fraction_digits(const currency_registry &registry, std::string_view code) noexcept {
    const auto contains = [code](const std::string &partition) {
        return partition.find(code) != std::string::npos;
    };
    if (contains(registry.minor0)) {
        return 0;
    }
    if (contains(registry.minor1)) {
        return 1;
    }
    if (contains(registry.minor3)) {
        return 3;
    }
    if (contains(registry.minor_undefined)) {
        return format::UNDEFINED_FRACTION_DIGITS;
    }
    return format::DEFAULT_FRACTION_DIGITS;
}

} // namespace curdata::core
