#include <curdata/core/other_currencies.hpp>

#include <curdata/core/numeric_code.hpp>

#include <string>
#include <utility>
#include <variant>

namespace curdata::core {

std::string other_currency_table::joined_codes() const {
    std::string joined;
    joined.reserve(currencies.size() * (CURRENCY_CODE_LENGTH + 1));
    for (const auto &currency : currencies) {
        if (!joined.empty()) {
            joined.push_back(format::OTHER_CURRENCIES_SEPARATOR);
        }
        joined += currency.code;
    }
    return joined;
}

bool reachable_from_main_table(const main_table &table, std::string_view code) {
    if (code.size() != CURRENCY_CODE_LENGTH || !main_table::is_country_code(code.substr(0, 2))) {
        return false;
    }
    const auto *simple = std::get_if<simple_country>(&table.at(code.substr(0, 2)));
    return simple != nullptr && simple->final_char == code[2] - 'A';
}

result<other_currency_table> build_other_currencies(const currency_registry &registry,
                                                    const main_table &table,
                                                    std::size_t capacity) {
    const std::string_view all = registry.all;
    constexpr std::size_t width = format::REGISTRY_RECORD_WIDTH;
    if (all.size() % width != width - 1) {
        return make_error(error_kind::malformed_registry_string, "\"all\" entry has incorrect size");
    }

    other_currency_table others;
    const std::size_t record_count = (all.size() + 1) / width;
    for (std::size_t record = 0; record < record_count; ++record) {
        const std::size_t offset = record * width;
        if (record > 0 && all[offset - 1] != format::REGISTRY_SEPARATOR) {
            return make_error(error_kind::malformed_registry_string, "incorrect separator in \"all\" entry");
        }
        const std::string_view code = all.substr(offset, CURRENCY_CODE_LENGTH);
        if (detail::parse_three_digits(all.substr(offset + CURRENCY_CODE_LENGTH, 3)) < 0) {
            return make_error(error_kind::malformed_registry_string,
                              "numeric code of " + std::string(code) + " in \"all\" entry is not three digits");
        }
        if (auto checked = validate_currency_code(registry, code); !checked) {
            return checked.failure();
        }
        if (reachable_from_main_table(table, code)) {
            continue;
        }
        if (others.currencies.size() == capacity) {
            return make_error(error_kind::too_many_other_currencies,
                              "too many other currencies (limit " + std::to_string(capacity) + ") at " +
                                  std::string(code));
        }
        auto info = describe_currency(registry, code);
        if (!info) {
            return info.failure();
        }
        others.currencies.push_back(std::move(info).value());
    }
    return others;
}

} // namespace curdata::core
