// include/curdata/generator.hpp — Drives the whole properties-to-image pipeline.

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <curdata/core/cut_over_time.hpp>
#include <curdata/core/error.hpp>
#include <curdata/core/registry.hpp>
#include <curdata/currency_data.hpp>
#include <curdata/io/properties.hpp>

namespace curdata {

struct generator_options {
    // Instant the cut-over sanity window is measured from; the system clock when unset.
    std::optional<std::int64_t> now_ms;
    std::int64_t sanity_window_ms = core::DEFAULT_SANITY_WINDOW_MS;
};

inline constexpr std::array<std::string_view, 7> REQUIRED_KEYS = {
    "formatVersion", "dataVersion", "all", "minor0", "minor1", "minor3", "minorUndefined",
};

struct generator_input {
    std::int32_t format_version = 0;
    std::int32_t data_version = 0;
    core::currency_registry registry;
};

std::int64_t current_time_ms();

// Signed decimal int32, no surrounding whitespace.
result<std::int32_t> parse_version(std::string_view key, std::string_view text);

result<generator_input> extract_input(const io::properties &values);

// Country keys are looked up in `values` itself.
result<currency_data> generate(const io::properties &values, const generator_options &options = {});

result<currency_data> generate_from_text(std::string_view text, const generator_options &options = {});

result<std::vector<std::uint8_t>> generate_image(std::string_view text, const generator_options &options = {});

} // namespace curdata
