// include/curdata/core/error.hpp — Error kinds and the tagged result type used by every build step.

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace curdata {

enum class error_kind {
    missing_input_key,
    invalid_currency_code_format,
    unknown_currency_code,
    fraction_digits_out_of_range,
    numeric_code_out_of_range,
    malformed_special_case_string,
    cut_over_time_out_of_sanity_window,
    too_many_special_cases,
    too_many_other_currencies,
    malformed_registry_string,
    output_write_failure,
    malformed_input,
    malformed_version,
    malformed_image,
};

constexpr std::string_view to_string(error_kind kind) noexcept {
    switch (kind) {
    case error_kind::missing_input_key:
        return "missing input key";
    case error_kind::invalid_currency_code_format:
        return "invalid currency code format";
    case error_kind::unknown_currency_code:
        return "unknown currency code";
    case error_kind::fraction_digits_out_of_range:
        return "fraction digits out of range";
    case error_kind::numeric_code_out_of_range:
        return "numeric code out of range";
    case error_kind::malformed_special_case_string:
        return "malformed special case string";
    case error_kind::cut_over_time_out_of_sanity_window:
        return "cut-over time out of sanity window";
    case error_kind::too_many_special_cases:
        return "too many special cases";
    case error_kind::too_many_other_currencies:
        return "too many other currencies";
    case error_kind::malformed_registry_string:
        return "malformed registry string";
    case error_kind::output_write_failure:
        return "output write failure";
    case error_kind::malformed_input:
        return "malformed input";
    case error_kind::malformed_version:
        return "malformed version";
    case error_kind::malformed_image:
        return "malformed image";
    }
    return "unknown error";
}

struct error {
    error_kind kind;
    std::string message;
};

inline error make_error(error_kind kind, std::string message) {
    return error{kind, std::move(message)};
}

// Holds either a value or the first error met while computing it.
template <typename T>
class [[nodiscard]] result {
public:
    using value_type = T;

    result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}
    result(error failure) : storage_(std::in_place_index<1>, std::move(failure)) {}

    bool ok() const noexcept {
        return storage_.index() == 0;
    }

    explicit operator bool() const noexcept {
        return ok();
    }

    T &value() & {
        require_value();
        return std::get<0>(storage_);
    }

    const T &value() const & {
        require_value();
        return std::get<0>(storage_);
    }

    T &&value() && {
        require_value();
        return std::get<0>(std::move(storage_));
    }

    const error &failure() const {
        if (ok()) {
            throw std::logic_error("result holds a value, not an error");
        }
        return std::get<1>(storage_);
    }

private:
    void require_value() const {
        if (!ok()) {
            throw std::logic_error("result holds an error: " + std::get<1>(storage_).message);
        }
    }

    std::variant<T, error> storage_;
};

// Result of a step that produces nothing but may fail.
using status = result<std::monostate>;

inline status ok_status() {
    return std::monostate{};
}

} // namespace curdata
