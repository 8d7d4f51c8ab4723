#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <variant>

#include <curdata/core/cut_over_time.hpp>
#include <curdata/core/main_table.hpp>
#include <curdata/core/special_cases.hpp>
#include <curdata/currency_data.hpp>

namespace curdata::util {

inline std::ostream& dump(std::ostream& os, const core::currency_info& info) {
    return os << info.code << '(' << info.fraction_digits << ", " << info.numeric_code << ')';
}

inline std::ostream& dump(std::ostream& os, const core::country_entry& entry) {
    switch (core::tag_of(entry)) {
    case core::entry_tag::invalid:
        return os << "invalid";
    case core::entry_tag::no_currency:
        return os << "no currency";
    case core::entry_tag::simple: {
        const auto& simple = std::get<core::simple_country>(entry);
        return os << "simple(" << static_cast<char>('A' + simple.final_char) << ", "
                  << simple.fraction_digits << ", " << simple.numeric_code << ')';
    }
    case core::entry_tag::special_case:
        return os << "special(" << std::get<core::special_case_country>(entry).index << ')';
    }
    return os;
}

inline std::ostream& dump(std::ostream& os, const core::special_case_record& record) {
    os << core::format_cut_over_time(record.cut_over_time) << ' ';
    dump(os, record.old_currency);
    if (record.new_currency) {
        os << " -> ";
        dump(os, *record.new_currency);
    }
    return os;
}

// Lists every valid country, then the side tables.
inline std::ostream& dump(std::ostream& os, const currency_data& data) {
    os << "format " << data.format_version << ", data " << data.data_version << '\n';
    for (std::size_t index = 0; index < data.main.size(); ++index) {
        if (core::tag_of(data.main[index]) == core::entry_tag::invalid) {
            continue;
        }
        os << core::main_table::country_code_at(index) << ' ';
        dump(os, data.main[index]) << '\n';
    }
    for (std::size_t index = 0; index < data.special_cases.size(); ++index) {
        os << "special " << index << ": ";
        dump(os, data.special_cases[index]) << '\n';
    }
    for (const auto& other : data.other_currencies.currencies) {
        os << "other ";
        dump(os, other) << '\n';
    }
    return os;
}

} // namespace curdata::util
