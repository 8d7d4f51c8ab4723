// include/curdata/core/main_table.hpp — The 26x26 country table and its packed int32 encoding.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include <curdata/core/error.hpp>
#include <curdata/core/registry.hpp>
#include <curdata/core/special_cases.hpp>
#include <curdata/format.hpp>

namespace curdata::core {

// Country code not present in the input.
struct invalid_country {
    bool operator==(const invalid_country &) const = default;
};

// Country present, but nothing in circulation.
struct country_without_currency {
    bool operator==(const country_without_currency &) const = default;
};

// Currency code starts with the country code.
struct simple_country {
    int final_char = 0; // third letter - 'A'
    int fraction_digits = 0;
    int numeric_code = 0;

    bool operator==(const simple_country &) const = default;
};

struct special_case_country {
    std::size_t index = 0; // 0-based, into the special case table

    bool operator==(const special_case_country &) const = default;
};

using country_entry = std::variant<invalid_country, country_without_currency, simple_country, special_case_country>;

enum class entry_tag {
    invalid,
    no_currency,
    simple,
    special_case,
};

inline entry_tag tag_of(const country_entry &entry) noexcept {
    return static_cast<entry_tag>(entry.index());
}

std::int32_t pack_entry(const country_entry &entry) noexcept;

// Rejects integers that no encoder would produce.
result<country_entry> unpack_entry(std::int32_t packed);

// Mapping from country (and other) keys to raw currency values.
using string_map = std::unordered_map<std::string, std::string>;

class main_table {
public:
    using packed_table = std::array<std::int32_t, format::MAIN_TABLE_SIZE>;

    static constexpr std::size_t index_of(char first, char second) noexcept {
        return static_cast<std::size_t>(first - 'A') * format::A_TO_Z + static_cast<std::size_t>(second - 'A');
    }

    static constexpr bool is_country_code(std::string_view code) noexcept {
        return code.size() == 2 && code[0] >= 'A' && code[0] <= 'Z' && code[1] >= 'A' && code[1] <= 'Z';
    }

    static std::string country_code_at(std::size_t index);

    // Throws std::out_of_range unless `country` is two letters A-Z.
    const country_entry &at(std::string_view country) const;

    const country_entry &operator[](std::size_t index) const noexcept {
        return entries_[index];
    }

    country_entry &operator[](std::size_t index) noexcept {
        return entries_[index];
    }

    constexpr std::size_t size() const noexcept {
        return format::MAIN_TABLE_SIZE;
    }

    packed_table packed() const noexcept;

    bool operator==(const main_table &) const = default;

private:
    std::array<country_entry, format::MAIN_TABLE_SIZE> entries_{};
};

// Classifies every country code; special cases are interned into `special_cases`.
result<main_table> build_main_table(const string_map &countries,
                                    const currency_registry &registry,
                                    special_case_registry &special_cases);

} // namespace curdata::core
