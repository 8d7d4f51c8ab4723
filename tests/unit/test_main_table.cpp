// tests/unit/test_main_table.cpp — Country classification and the packed entry layout.

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>

#include <curdata/curdata.hpp>

#include "fixtures.hpp"

namespace {

using curdata::error_kind;
using curdata::core::country_entry;
using curdata::core::entry_tag;
using curdata::core::main_table;
using curdata::core::special_case_registry;
using curdata::core::string_map;
using namespace curdata_test;
namespace format = curdata::format;

curdata::result<main_table> build(const string_map &countries,
                                  const curdata::core::currency_registry &registry,
                                  special_case_registry &cases) {
    return curdata::core::build_main_table(countries, registry, cases);
}

bool test_simple_entry() {
    const auto registry = small_registry();
    special_case_registry cases(registry, fixed_now());
    const auto table = build({{"US", "USD"}, {"JP", "JPY"}, {"BH", "BHD"}}, registry, cases);
    if (!expect_ok(table, "simple table")) {
        return false;
    }
    const auto *us = std::get_if<curdata::core::simple_country>(&table.value().at("US"));
    if (us == nullptr || us->final_char != 'D' - 'A' || us->fraction_digits != 2 || us->numeric_code != 840) {
        std::cerr << "US simple entry\n";
        return false;
    }
    const std::int32_t packed = curdata::core::pack_entry(*us);
    const std::int32_t expected = 3 | (2 << 5) | (840 << 8);
    if (packed != expected) {
        std::cerr << "US packed entry " << packed << " expected " << expected << "\n";
        return false;
    }
    const auto *jp = std::get_if<curdata::core::simple_country>(&table.value().at("JP"));
    const auto *bh = std::get_if<curdata::core::simple_country>(&table.value().at("BH"));
    if (jp == nullptr || jp->fraction_digits != 0 || bh == nullptr || bh->fraction_digits != 3) {
        std::cerr << "0 and 3 fraction digits must be accepted\n";
        return false;
    }
    return cases.size() == 0;
}

bool test_invalid_and_no_currency() {
    const auto registry = small_registry();
    special_case_registry cases(registry, fixed_now());
    const auto table = build({{"EA", ""}}, registry, cases);
    if (!expect_ok(table, "no currency table")) {
        return false;
    }
    bool ok = true;
    if (curdata::core::pack_entry(table.value().at("EA")) != format::COUNTRY_WITHOUT_CURRENCY_ENTRY) {
        std::cerr << "EA must be the no currency constant\n";
        ok = false;
    }
    if (curdata::core::pack_entry(table.value().at("ZZ")) != format::INVALID_COUNTRY_ENTRY) {
        std::cerr << "absent country must be invalid\n";
        ok = false;
    }
    return ok;
}

bool test_special_entries() {
    const auto registry = small_registry();
    special_case_registry cases(registry, fixed_now());
    const auto table = build({{"AD", "EUR"}, {"DE", "EUR"}, {"XX", "ABC;2020-01-01-00-00-00;XYZ"}, {"US", "ABC"}},
                             registry, cases);
    if (!expect_ok(table, "special table")) {
        return false;
    }
    const auto &entries = table.value();
    // Row-major order: AD, DE, US, XX.
    const auto *ad = std::get_if<curdata::core::special_case_country>(&entries.at("AD"));
    const auto *de = std::get_if<curdata::core::special_case_country>(&entries.at("DE"));
    const auto *us = std::get_if<curdata::core::special_case_country>(&entries.at("US"));
    const auto *xx = std::get_if<curdata::core::special_case_country>(&entries.at("XX"));
    if (ad == nullptr || de == nullptr || us == nullptr || xx == nullptr) {
        std::cerr << "special entries missing\n";
        return false;
    }
    if (ad->index != 0 || de->index != 0 || us->index != 1 || xx->index != 2 || cases.size() != 3) {
        std::cerr << "special case indices " << ad->index << ' ' << de->index << ' ' << us->index << ' '
                  << xx->index << "\n";
        return false;
    }
    if (curdata::core::pack_entry(*ad) != (format::SPECIAL_CASE_COUNTRY_MASK | 1) ||
        curdata::core::pack_entry(*xx) != (format::SPECIAL_CASE_COUNTRY_MASK | 3)) {
        std::cerr << "special entries are stored with index + 1\n";
        return false;
    }
    const auto &record = cases.records()[xx->index];
    if (record.cut_over_time != 1577836800000LL || record.old_currency.code != "ABC" || !record.new_currency ||
        record.new_currency->code != "XYZ") {
        std::cerr << "XX transition record\n";
        return false;
    }
    const auto &terminal = cases.records()[us->index];
    if (terminal.cut_over_time != format::NEVER_CUT_OVER || terminal.old_currency.code != "ABC" ||
        terminal.new_currency) {
        std::cerr << "US terminal record\n";
        return false;
    }
    return true;
}

// Any currency whose first two letters match the country is simple, even when it is
// not the country's usual currency.
bool test_prefix_match_is_simple() {
    const auto registry = small_registry();
    special_case_registry cases(registry, fixed_now());
    const auto table = build({{"US", "USN"}}, registry, cases);
    if (!expect_ok(table, "US=USN table")) {
        return false;
    }
    const auto *us = std::get_if<curdata::core::simple_country>(&table.value().at("US"));
    if (us == nullptr || us->final_char != 'N' - 'A' || us->fraction_digits != 2 || us->numeric_code != 997 ||
        cases.size() != 0) {
        std::cerr << "US=USN must be a simple entry\n";
        return false;
    }
    return true;
}

bool test_tags_unambiguous() {
    const auto registry = small_registry();
    special_case_registry cases(registry, fixed_now());
    const auto table =
        build({{"AD", "EUR"}, {"EA", ""}, {"JP", "JPY"}, {"US", "USD"}, {"XX", "ABC;2020-01-01-00-00-00;XYZ"}},
              registry, cases);
    if (!expect_ok(table, "mixed table")) {
        return false;
    }
    std::size_t counts[4] = {};
    bool ok = true;
    for (std::size_t index = 0; index < table.value().size(); ++index) {
        const country_entry &entry = table.value()[index];
        const auto unpacked = curdata::core::unpack_entry(curdata::core::pack_entry(entry));
        if (!unpacked || unpacked.value() != entry) {
            std::cerr << "entry for " << main_table::country_code_at(index) << " does not decode to itself\n";
            ok = false;
        }
        ++counts[static_cast<int>(curdata::core::tag_of(entry))];
    }
    if (counts[static_cast<int>(entry_tag::invalid)] != 671 || counts[static_cast<int>(entry_tag::no_currency)] != 1 ||
        counts[static_cast<int>(entry_tag::simple)] != 2 || counts[static_cast<int>(entry_tag::special_case)] != 2) {
        std::cerr << "tag counts\n";
        ok = false;
    }

    // Every special index the field can hold, and every simple corner.
    for (std::size_t index = 0; index < format::MAX_SPECIAL_CASES; ++index) {
        const country_entry entry = curdata::core::special_case_country{index};
        const auto unpacked = curdata::core::unpack_entry(curdata::core::pack_entry(entry));
        if (!unpacked || unpacked.value() != entry) {
            std::cerr << "special index " << index << " round trip\n";
            ok = false;
        }
    }
    for (int final_char : {0, 25}) {
        for (int digits : {0, 1, 2, 3}) {
            for (int numeric : {0, 999}) {
                const country_entry entry = curdata::core::simple_country{final_char, digits, numeric};
                const auto unpacked = curdata::core::unpack_entry(curdata::core::pack_entry(entry));
                if (!unpacked || unpacked.value() != entry) {
                    std::cerr << "simple corner round trip\n";
                    ok = false;
                }
            }
        }
    }
    ok &= expect_error(curdata::core::unpack_entry(0x1A), error_kind::malformed_image, "final char 26");
    ok &= expect_error(curdata::core::unpack_entry(0x80 | 0x100), error_kind::malformed_image, "stray special bits");
    ok &= expect_error(curdata::core::unpack_entry(0x40000), error_kind::malformed_image, "bits above numeric code");
    return ok;
}

bool test_failures() {
    auto registry = small_registry();
    bool ok = true;
    {
        special_case_registry cases(registry, fixed_now());
        ok &= expect_error(build({{"XA", "XAU"}}, registry, cases), error_kind::fraction_digits_out_of_range,
                           "undefined minor units in simple entry");
    }
    {
        special_case_registry cases(registry, fixed_now());
        // Graphically valid, never listed.
        ok &= expect_error(build({{"GB", "GBP"}}, registry, cases), error_kind::unknown_currency_code,
                           "unknown simple currency");
    }
    {
        special_case_registry cases(registry, fixed_now());
        ok &= expect_error(build({{"US", "USD;2020"}}, registry, cases), error_kind::malformed_special_case_string,
                           "malformed transition");
    }
    {
        special_case_registry cases(registry, fixed_now());
        ok &= expect_error(build({{"US", "USd"}}, registry, cases), error_kind::invalid_currency_code_format,
                           "lower case third letter");
    }
    {
        // Undefined minor units are fine in the side table.
        special_case_registry cases(registry, fixed_now());
        const auto table = build({{"CH", "XAU"}}, registry, cases);
        ok &= expect_ok(table, "undefined minor units in special case");
        if (table && cases.records()[0].old_currency.fraction_digits != -1) {
            std::cerr << "side record keeps -1\n";
            ok = false;
        }
    }
    {
        registry.all += "-XB5000";
        special_case_registry cases(registry, fixed_now());
        const auto table = build({{"XB", "XB5"}}, registry, cases);
        ok &= expect_ok(table, "legacy code");
        if (table && curdata::core::tag_of(table.value().at("XB")) != entry_tag::special_case) {
            std::cerr << "legacy code with a digit cannot be a simple entry\n";
            ok = false;
        }
    }
    return ok;
}

} // namespace

int
main() {
    bool all_good = true;
    all_good &= test_simple_entry();
    all_good &= test_invalid_and_no_currency();
    all_good &= test_special_entries();
    all_good &= test_prefix_match_is_simple();
    all_good &= test_tags_unambiguous();
    all_good &= test_failures();
    if (!all_good) {
        std::cerr << "main table tests failed\n";
        return 1;
    }
    std::cout << "main table tests passed\n";
    return 0;
}
