// tests/unit/test_cut_over_time.cpp — Strict UTC parsing of cut-over instants.

#include <cstdint>
#include <iostream>
#include <string>

#include <curdata/curdata.hpp>

#include "fixtures.hpp"

namespace {

using curdata::error_kind;
using namespace curdata_test;

bool expect_time(const char *text, std::int64_t expected) {
    const auto parsed = curdata::core::parse_cut_over_time(text);
    if (!parsed || parsed.value() != expected) {
        std::cerr << "parse " << text << ": expected " << expected << " got "
                  << (parsed ? std::to_string(parsed.value()) : parsed.failure().message) << "\n";
        return false;
    }
    return true;
}

bool test_parse_valid() {
    bool ok = true;
    ok &= expect_time("1970-01-01-00-00-00", 0);
    ok &= expect_time("2020-01-01-00-00-00", 1577836800000LL);
    ok &= expect_time("2008-01-01-00-00-00", 1199145600000LL);
    ok &= expect_time("2024-02-29-12-30-45", 1709209845000LL);
    ok &= expect_time("1969-12-31-23-59-59", -1000);
    return ok;
}

bool test_parse_strict() {
    const char *rejected[] = {
        "2023-02-29-00-00-00", // not a leap year
        "2020-13-01-00-00-00",
        "2020-00-10-00-00-00",
        "2020-04-31-00-00-00",
        "2020-01-01-24-00-00",
        "2020-01-01-00-60-00",
        "2020-01-01-00-00-60",
        "2020/01/01-00-00-00",
        "2020-1-01-00-00-000",
        "2023-1-1-0-0-0",
        "2020-01-01-00-00",
        "2020-01-01-00-00-00Z",
        "",
        "abcd-ef-gh-ij-kl-mn",
    };
    bool ok = true;
    for (const char *text : rejected) {
        ok &= expect_error(curdata::core::parse_cut_over_time(text), error_kind::malformed_special_case_string, text);
    }
    return ok;
}

bool test_format_round_trip() {
    bool ok = true;
    for (const char *text : {"2020-01-01-00-00-00", "2024-02-29-12-30-45", "1969-12-31-23-59-59",
                             "2100-03-01-06-07-08"}) {
        const auto parsed = curdata::core::parse_cut_over_time(text);
        if (!parsed || curdata::core::format_cut_over_time(parsed.value()) != text) {
            std::cerr << "format round trip for " << text << "\n";
            ok = false;
        }
    }
    if (curdata::core::format_cut_over_time(curdata::format::NEVER_CUT_OVER) != "never") {
        std::cerr << "never sentinel formatting\n";
        ok = false;
    }
    return ok;
}

bool test_sanity_window() {
    const std::int64_t now = fixed_now();
    const std::int64_t window = curdata::core::DEFAULT_SANITY_WINDOW_MS;
    bool ok = true;
    ok &= expect_ok(curdata::core::check_sanity_window(now, now), "now");
    ok &= expect_ok(curdata::core::check_sanity_window(now + window, now), "window edge ahead");
    ok &= expect_ok(curdata::core::check_sanity_window(now - window, now), "window edge behind");
    ok &= expect_error(curdata::core::check_sanity_window(now + window + 1, now),
                       error_kind::cut_over_time_out_of_sanity_window, "just beyond the window");
    ok &= expect_error(curdata::core::check_sanity_window(now - window - 1, now),
                       error_kind::cut_over_time_out_of_sanity_window, "just before the window");
    return ok;
}

} // namespace

int
main() {
    bool all_good = true;
    all_good &= test_parse_valid();
    all_good &= test_parse_strict();
    all_good &= test_format_round_trip();
    all_good &= test_sanity_window();
    if (!all_good) {
        std::cerr << "cut-over time tests failed\n";
        return 1;
    }
    std::cout << "cut-over time tests passed\n";
    return 0;
}
