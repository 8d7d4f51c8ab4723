// tests/unit/fixtures.hpp — Small registries and inputs shared by the unit tests.

#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include <curdata/curdata.hpp>

namespace curdata_test {

inline curdata::core::currency_registry small_registry() {
    curdata::core::currency_registry registry;
    registry.all = "ABC123-ADP020-BHD048-EUR978-JPY392-USD840-USN997-XAU959-XYZ456";
    registry.minor0 = "ADPJPY";
    registry.minor1 = "";
    registry.minor3 = "BHD";
    registry.minor_undefined = "XAU";
    return registry;
}

// 2026-01-01T00:00:00Z
inline std::int64_t fixed_now() {
    curdata::core::utc_fields fields;
    fields.year = 2026;
    return curdata::core::millis_from_civil(fields);
}

inline curdata::generator_options fixed_options() {
    curdata::generator_options options;
    options.now_ms = fixed_now();
    return options;
}

inline std::string small_properties_text() {
    return "formatVersion=3\n"
           "dataVersion=42\n"
           "all=ABC123-ADP020-BHD048-EUR978-JPY392-USD840-USN997-XAU959-XYZ456\n"
           "minor0=ADPJPY\n"
           "minor1=\n"
           "minor3=BHD\n"
           "minorUndefined=XAU\n"
           "AD=EUR\n"
           "BH=BHD\n"
           "DE=EUR\n"
           "EA=\n"
           "JP=JPY\n"
           "US=USD\n"
           "XX=ABC;2020-01-01-00-00-00;XYZ\n";
}

template <typename T>
bool expect_error(const curdata::result<T> &outcome, curdata::error_kind kind, const char *what) {
    if (outcome) {
        std::cerr << what << ": expected failure '" << curdata::to_string(kind) << "', got success\n";
        return false;
    }
    if (outcome.failure().kind != kind) {
        std::cerr << what << ": expected '" << curdata::to_string(kind) << "', got '"
                  << curdata::to_string(outcome.failure().kind) << "' (" << outcome.failure().message << ")\n";
        return false;
    }
    return true;
}

template <typename T>
bool expect_ok(const curdata::result<T> &outcome, const char *what) {
    if (!outcome) {
        std::cerr << what << ": unexpected failure: " << outcome.failure().message << "\n";
        return false;
    }
    return true;
}

} // namespace curdata_test
