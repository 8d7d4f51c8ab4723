// tests/unit/test_currency_codes.cpp — Currency code validation, minor units and numeric codes.

#include <iostream>
#include <string>

#include <curdata/curdata.hpp>

#include "fixtures.hpp"

namespace {

using curdata::error_kind;
using curdata::core::currency_registry;
using namespace curdata_test;

bool test_validation() {
    const currency_registry registry = small_registry();
    bool ok = true;
    ok &= expect_ok(curdata::core::validate_currency_code(registry, "USD"), "USD is valid");
    ok &= expect_error(curdata::core::validate_currency_code(registry, "US"),
                       error_kind::invalid_currency_code_format, "two letters");
    ok &= expect_error(curdata::core::validate_currency_code(registry, "USDX"),
                       error_kind::invalid_currency_code_format, "four letters");
    ok &= expect_error(curdata::core::validate_currency_code(registry, "usd"),
                       error_kind::invalid_currency_code_format, "lower case");
    ok &= expect_error(curdata::core::validate_currency_code(registry, "U5D"),
                       error_kind::invalid_currency_code_format, "digit");
    // Well formed but absent from "all".
    ok &= expect_error(curdata::core::validate_currency_code(registry, "GBP"),
                       error_kind::unknown_currency_code, "unlisted code");

    // The legacy code is exempt from the letter rule, not from the list.
    ok &= expect_error(curdata::core::validate_currency_code(registry, "XB5"),
                       error_kind::unknown_currency_code, "unlisted legacy code");
    currency_registry legacy = registry;
    legacy.all += "-XB5000";
    ok &= expect_ok(curdata::core::validate_currency_code(legacy, "XB5"), "listed legacy code");
    ok &= expect_error(curdata::core::validate_currency_code(legacy, "XB6"),
                       error_kind::invalid_currency_code_format, "other code with digit");
    if (curdata::core::is_well_formed_currency_code("AB") || !curdata::core::is_well_formed_currency_code("XB5")) {
        std::cerr << "is_well_formed_currency_code\n";
        ok = false;
    }
    return ok;
}

bool test_fraction_digits() {
    currency_registry registry = small_registry();
    const struct {
        const char *code;
        int digits;
    } cases[] = {
        {"JPY", 0}, {"ADP", 0}, {"BHD", 3}, {"XAU", -1}, {"USD", 2}, {"EUR", 2},
    };
    bool ok = true;
    for (const auto &entry : cases) {
        const int digits = curdata::core::resolve_fraction_digits(registry, entry.code);
        if (digits != entry.digits) {
            std::cerr << "fraction digits for " << entry.code << ": expected " << entry.digits << " got " << digits
                      << "\n";
            ok = false;
        }
    }

    // minor0 wins over minor3 when a code is listed in both.
    registry.minor3 += "JPY";
    registry.minor1 = "EUR";
    if (curdata::core::resolve_fraction_digits(registry, "JPY") != 0 ||
        curdata::core::resolve_fraction_digits(registry, "EUR") != 1) {
        std::cerr << "fraction digit priority\n";
        ok = false;
    }
    return ok;
}

bool test_numeric_codes() {
    currency_registry registry = small_registry();
    bool ok = true;
    const auto usd = curdata::core::resolve_numeric_code(registry, "USD");
    ok &= expect_ok(usd, "USD numeric");
    if (usd && usd.value() != 840) {
        std::cerr << "USD numeric code " << usd.value() << "\n";
        ok = false;
    }
    const auto adp = curdata::core::resolve_numeric_code(registry, "ADP");
    if (!adp || adp.value() != 20) {
        std::cerr << "leading zeros in numeric code\n";
        ok = false;
    }
    ok &= expect_error(curdata::core::resolve_numeric_code(registry, "GBP"), error_kind::unknown_currency_code,
                       "numeric code of unlisted code");

    registry.all = "USD8X0-EUR978";
    ok &= expect_error(curdata::core::resolve_numeric_code(registry, "USD"), error_kind::malformed_registry_string,
                       "non-digit numeric code");
    registry.all = "EUR978-USD";
    ok &= expect_error(curdata::core::resolve_numeric_code(registry, "USD"), error_kind::malformed_registry_string,
                       "missing numeric code");
    return ok;
}

bool test_describe_currency() {
    const currency_registry registry = small_registry();
    const auto info = curdata::core::describe_currency(registry, "BHD");
    if (!info || info.value().code != "BHD" || info.value().fraction_digits != 3 ||
        info.value().numeric_code != 48) {
        std::cerr << "describe_currency BHD\n";
        return false;
    }
    return expect_error(curdata::core::describe_currency(registry, "bhd"), error_kind::invalid_currency_code_format,
                        "describe malformed code");
}

} // namespace

int
main() {
    bool all_good = true;
    all_good &= test_validation();
    all_good &= test_fraction_digits();
    all_good &= test_numeric_codes();
    all_good &= test_describe_currency();
    if (!all_good) {
        std::cerr << "currency code tests failed\n";
        return 1;
    }
    std::cout << "currency code tests passed\n";
    return 0;
}
