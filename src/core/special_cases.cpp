#include <curdata/core/special_cases.hpp>

#include <string>
#include <utility>

namespace curdata::core {

namespace {

// Shortest transition: "AAA;;BBB" (the time is then rejected on its own).
constexpr std::size_t MIN_TRANSITION_LENGTH = 2 * CURRENCY_CODE_LENGTH + 2;

} // namespace

result<special_case_record> parse_special_case(const currency_registry &registry,
                                               std::string_view raw,
                                               std::int64_t now_ms,
                                               std::int64_t window_ms) {
    special_case_record record;
    if (raw.size() == CURRENCY_CODE_LENGTH) {
        auto only = describe_currency(registry, raw);
        if (!only) {
            return only.failure();
        }
        record.cut_over_time = format::NEVER_CUT_OVER;
        record.old_currency = std::move(only).value();
        return record;
    }

    const std::size_t length = raw.size();
    if (length < MIN_TRANSITION_LENGTH || raw[CURRENCY_CODE_LENGTH] != format::SPECIAL_CASE_SEPARATOR ||
        raw[length - CURRENCY_CODE_LENGTH - 1] != format::SPECIAL_CASE_SEPARATOR) {
        return make_error(error_kind::malformed_special_case_string,
                          "invalid currency info: " + std::string(raw));
    }
    const std::string_view old_code = raw.substr(0, CURRENCY_CODE_LENGTH);
    const std::string_view new_code = raw.substr(length - CURRENCY_CODE_LENGTH);
    const std::string_view time_text =
        raw.substr(CURRENCY_CODE_LENGTH + 1, length - 2 * (CURRENCY_CODE_LENGTH + 1));

    auto old_currency = describe_currency(registry, old_code);
    if (!old_currency) {
        return old_currency.failure();
    }
    auto new_currency = describe_currency(registry, new_code);
    if (!new_currency) {
        return new_currency.failure();
    }
    auto time = parse_cut_over_time(time_text);
    if (!time) {
        return time.failure();
    }
    if (auto window = check_sanity_window(time.value(), now_ms, window_ms); !window) {
        return window.failure();
    }

    record.cut_over_time = time.value();
    record.old_currency = std::move(old_currency).value();
    record.new_currency = std::move(new_currency).value();
    return record;
}

special_case_registry::special_case_registry(const currency_registry &registry,
                                             std::int64_t now_ms,
                                             std::int64_t window_ms,
                                             std::size_t capacity)
    : registry_(&registry), now_ms_(now_ms), window_ms_(window_ms), capacity_(capacity) {
    records_.reserve(capacity_);
}

result<std::size_t> special_case_registry::intern(std::string_view raw) {
    const std::string key(raw);
    if (const auto found = indices_.find(key); found != indices_.end()) {
        return found->second;
    }
    if (records_.size() == capacity_) {
        return make_error(error_kind::too_many_special_cases,
                          "too many special cases (limit " + std::to_string(capacity_) + ") at " + key);
    }
    auto record = parse_special_case(*registry_, raw, now_ms_, window_ms_);
    if (!record) {
        return record.failure();
    }
    const std::size_t index = records_.size();
    records_.push_back(std::move(record).value());
    indices_.emplace(key, index);
    return index;
}

} // namespace curdata::core
