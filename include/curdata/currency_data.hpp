// include/curdata/currency_data.hpp — Every table that goes into one binary currency image.

#pragma once

#include <cstdint>
#include <vector>

#include <curdata/core/main_table.hpp>
#include <curdata/core/other_currencies.hpp>
#include <curdata/core/special_cases.hpp>

namespace curdata {

struct currency_data {
    std::int32_t format_version = 0;
    std::int32_t data_version = 0;
    core::main_table main;
    std::vector<core::special_case_record> special_cases;
    core::other_currency_table other_currencies;

    bool operator==(const currency_data &) const = default;
};

} // namespace curdata
