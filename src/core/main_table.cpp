#include <curdata/core/main_table.hpp>

#include <curdata/core/currency_info.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace curdata::core {

namespace {

struct entry_packer {
    std::int32_t operator()(const invalid_country &) const noexcept {
        return format::INVALID_COUNTRY_ENTRY;
    }

    std::int32_t operator()(const country_without_currency &) const noexcept {
        return format::COUNTRY_WITHOUT_CURRENCY_ENTRY;
    }

    std::int32_t operator()(const simple_country &entry) const noexcept {
        return format::SIMPLE_CASE_COUNTRY_MASK | entry.final_char |
               (entry.fraction_digits << format::SIMPLE_CASE_COUNTRY_DEFAULT_DIGITS_SHIFT) |
               (entry.numeric_code << format::NUMERIC_CODE_SHIFT);
    }

    std::int32_t operator()(const special_case_country &entry) const noexcept {
        return format::SPECIAL_CASE_COUNTRY_MASK |
               (static_cast<std::int32_t>(entry.index) + format::SPECIAL_CASE_COUNTRY_INDEX_DELTA);
    }
};

constexpr std::int32_t SIMPLE_CASE_USED_BITS = format::SIMPLE_CASE_COUNTRY_FINAL_CHAR_MASK |
                                               format::SIMPLE_CASE_COUNTRY_DEFAULT_DIGITS_MASK |
                                               format::NUMERIC_CODE_MASK;

error malformed_entry(std::int32_t packed) {
    return make_error(error_kind::malformed_image, "undecodable main table entry " + std::to_string(packed));
}

result<country_entry> build_simple_entry(const currency_registry &registry, std::string_view code) {
    auto info = describe_currency(registry, code);
    if (!info) {
        return info.failure();
    }
    const currency_info &currency = info.value();
    if (currency.fraction_digits < 0 || currency.fraction_digits > format::MAX_SIMPLE_FRACTION_DIGITS) {
        return make_error(error_kind::fraction_digits_out_of_range,
                          "fraction digits out of range for " + currency.code);
    }
    if (currency.numeric_code < 0 || currency.numeric_code > format::MAX_NUMERIC_CODE) {
        return make_error(error_kind::numeric_code_out_of_range,
                          "numeric code out of range for " + currency.code);
    }
    simple_country entry;
    entry.final_char = code[2] - 'A';
    entry.fraction_digits = currency.fraction_digits;
    entry.numeric_code = currency.numeric_code;
    return country_entry{entry};
}

} // namespace

std::int32_t pack_entry(const country_entry &entry) noexcept {
    return std::visit(entry_packer{}, entry);
}

result<country_entry> unpack_entry(std::int32_t packed) {
    if (packed == format::INVALID_COUNTRY_ENTRY) {
        return country_entry{invalid_country{}};
    }
    if ((packed & format::SPECIAL_CASE_COUNTRY_MASK) != 0) {
        if ((packed & ~(format::SPECIAL_CASE_COUNTRY_MASK | format::SPECIAL_CASE_COUNTRY_INDEX_MASK)) != 0) {
            return malformed_entry(packed);
        }
        const std::int32_t component = packed & format::SPECIAL_CASE_COUNTRY_INDEX_MASK;
        if (component == 0) {
            return country_entry{country_without_currency{}};
        }
        special_case_country entry;
        entry.index = static_cast<std::size_t>(component - format::SPECIAL_CASE_COUNTRY_INDEX_DELTA);
        return country_entry{entry};
    }
    if ((packed & ~SIMPLE_CASE_USED_BITS) != 0) {
        return malformed_entry(packed);
    }
    simple_country entry;
    entry.final_char = packed & format::SIMPLE_CASE_COUNTRY_FINAL_CHAR_MASK;
    entry.fraction_digits = (packed & format::SIMPLE_CASE_COUNTRY_DEFAULT_DIGITS_MASK) >>
                            format::SIMPLE_CASE_COUNTRY_DEFAULT_DIGITS_SHIFT;
    entry.numeric_code = (packed & format::NUMERIC_CODE_MASK) >> format::NUMERIC_CODE_SHIFT;
    if (entry.final_char >= format::A_TO_Z || entry.numeric_code > format::MAX_NUMERIC_CODE) {
        return malformed_entry(packed);
    }
    return country_entry{entry};
}

std::string main_table::country_code_at(std::size_t index) {
    if (index >= format::MAIN_TABLE_SIZE) {
        throw std::out_of_range("main table index out of range");
    }
    std::string code(2, 'A');
    code[0] = static_cast<char>('A' + index / format::A_TO_Z);
    code[1] = static_cast<char>('A' + index % format::A_TO_Z);
    return code;
}

const country_entry &main_table::at(std::string_view country) const {
    if (!is_country_code(country)) {
        throw std::out_of_range("not a two-letter country code: " + std::string(country));
    }
    return entries_[index_of(country[0], country[1])];
}

main_table::packed_table main_table::packed() const noexcept {
    packed_table table{};
    for (std::size_t index = 0; index < entries_.size(); ++index) {
        table[index] = pack_entry(entries_[index]);
    }
    return table;
}

result<main_table> build_main_table(const string_map &countries,
                                    const currency_registry &registry,
                                    special_case_registry &special_cases) {
    main_table table;
    for (int first = 0; first < format::A_TO_Z; ++first) {
        for (int second = 0; second < format::A_TO_Z; ++second) {
            const char first_char = static_cast<char>('A' + first);
            const char second_char = static_cast<char>('A' + second);
            const std::size_t index = main_table::index_of(first_char, second_char);
            const auto found = countries.find(std::string{first_char, second_char});
            if (found == countries.end()) {
                table[index] = invalid_country{};
                continue;
            }
            const std::string &currency = found->second;
            if (currency.empty()) {
                table[index] = country_without_currency{};
                continue;
            }
            // A non-letter third character has no offset; such codes go to the side table.
            // Prefix matching alone would make "XB5" simple with a negative offset; images for
            // countries mapped to such a code differ from generators that do that.
            if (currency.size() == CURRENCY_CODE_LENGTH && currency[0] == first_char &&
                currency[1] == second_char && currency[2] >= 'A' && currency[2] <= 'Z') {
                auto simple = build_simple_entry(registry, currency);
                if (!simple) {
                    return simple.failure();
                }
                table[index] = std::move(simple).value();
                continue;
            }
            auto special = special_cases.intern(currency);
            if (!special) {
                return special.failure();
            }
            table[index] = special_case_country{special.value()};
        }
    }
    return table;
}

} // namespace curdata::core
