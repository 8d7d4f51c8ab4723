// include/curdata/core/other_currencies.hpp — Currencies that no main table entry can reach.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <curdata/core/currency_info.hpp>
#include <curdata/core/error.hpp>
#include <curdata/core/main_table.hpp>
#include <curdata/core/registry.hpp>
#include <curdata/format.hpp>

namespace curdata::core {

struct other_currency_table {
    std::vector<currency_info> currencies; // registry order

    std::size_t size() const noexcept {
        return currencies.size();
    }

    // "AAA-BBB-CCC", the form stored in the binary image.
    std::string joined_codes() const;

    bool operator==(const other_currency_table &) const = default;
};

// True when the entry at the code's first two letters is simple and ends in the code's third letter.
bool reachable_from_main_table(const main_table &table, std::string_view code);

result<other_currency_table> build_other_currencies(const currency_registry &registry,
                                                    const main_table &table,
                                                    std::size_t capacity = format::MAX_OTHER_CURRENCIES);

} // namespace curdata::core
