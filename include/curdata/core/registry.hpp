// include/curdata/core/registry.hpp — Authoritative currency code list and minor unit partitions.

#pragma once

#include <string>
#include <string_view>

namespace curdata::core {

struct currency_registry {
    std::string all;             // "AAA999-BBB999-..." records
    std::string minor0;          // codes with 0 fraction digits
    std::string minor1;          // codes with 1 fraction digit
    std::string minor3;          // codes with 3 fraction digits
    std::string minor_undefined; // codes without meaningful minor units

    bool lists(std::string_view code) const noexcept {
        return all.find(code) != std::string::npos;
    }
};

} // namespace curdata::core
