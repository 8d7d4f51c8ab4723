// include/curdata/core/special_cases.hpp — Deduplicated side table for countries outside the simple encoding.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <curdata/core/currency_info.hpp>
#include <curdata/core/cut_over_time.hpp>
#include <curdata/core/error.hpp>
#include <curdata/core/registry.hpp>
#include <curdata/format.hpp>

namespace curdata::core {

struct special_case_record {
    std::int64_t cut_over_time = format::NEVER_CUT_OVER;
    currency_info old_currency;
    std::optional<currency_info> new_currency; // empty when nothing follows

    bool operator==(const special_case_record &) const = default;
};

// Accepts either a bare code ("EUR") or a transition "OLD;yyyy-MM-dd-HH-mm-ss;NEW".
result<special_case_record> parse_special_case(const currency_registry &registry,
                                               std::string_view raw,
                                               std::int64_t now_ms,
                                               std::int64_t window_ms = DEFAULT_SANITY_WINDOW_MS);

class special_case_registry {
public:
    special_case_registry(const currency_registry &registry,
                          std::int64_t now_ms,
                          std::int64_t window_ms = DEFAULT_SANITY_WINDOW_MS,
                          std::size_t capacity = format::MAX_SPECIAL_CASES);

    // Identical raw strings share one record; returns the 0-based index.
    result<std::size_t> intern(std::string_view raw);

    std::size_t size() const noexcept {
        return records_.size();
    }

    std::size_t capacity() const noexcept {
        return capacity_;
    }

    const std::vector<special_case_record> &records() const noexcept {
        return records_;
    }

    std::vector<special_case_record> release() && {
        indices_.clear();
        return std::move(records_);
    }

private:
    const currency_registry *registry_;
    std::int64_t now_ms_;
    std::int64_t window_ms_;
    std::size_t capacity_;
    std::unordered_map<std::string, std::size_t> indices_;
    std::vector<special_case_record> records_;
};

} // namespace curdata::core
