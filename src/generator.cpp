#include <curdata/generator.hpp>

#include <curdata/core/main_table.hpp>
#include <curdata/core/other_currencies.hpp>
#include <curdata/core/special_cases.hpp>
#include <curdata/io/image.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace curdata {

std::int64_t current_time_ms() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

result<std::int32_t> parse_version(std::string_view key, std::string_view text) {
    const auto malformed = [&]() {
        return make_error(error_kind::malformed_version,
                          "\"" + std::string(key) + "\" is not an int: \"" + std::string(text) + "\"");
    };
    std::size_t index = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        ++index;
    }
    if (index == text.size()) {
        return malformed();
    }
    std::int64_t value = 0;
    for (; index < text.size(); ++index) {
        const char ch = text[index];
        if (ch < '0' || ch > '9') {
            return malformed();
        }
        value = value * 10 + (ch - '0');
        if (value > static_cast<std::int64_t>(std::numeric_limits<std::int32_t>::max()) + 1) {
            return malformed();
        }
    }
    if (negative) {
        value = -value;
    }
    if (value > std::numeric_limits<std::int32_t>::max() || value < std::numeric_limits<std::int32_t>::min()) {
        return malformed();
    }
    return static_cast<std::int32_t>(value);
}

result<generator_input> extract_input(const io::properties &values) {
    for (const std::string_view key : REQUIRED_KEYS) {
        if (values.find(std::string(key)) == values.end()) {
            return make_error(error_kind::missing_input_key,
                              "not all required data is defined in input: missing \"" + std::string(key) + "\"");
        }
    }
    generator_input input;
    auto format_version = parse_version("formatVersion", values.at("formatVersion"));
    if (!format_version) {
        return format_version.failure();
    }
    auto data_version = parse_version("dataVersion", values.at("dataVersion"));
    if (!data_version) {
        return data_version.failure();
    }
    input.format_version = format_version.value();
    input.data_version = data_version.value();
    input.registry.all = values.at("all");
    input.registry.minor0 = values.at("minor0");
    input.registry.minor1 = values.at("minor1");
    input.registry.minor3 = values.at("minor3");
    input.registry.minor_undefined = values.at("minorUndefined");
    return input;
}

result<currency_data> generate(const io::properties &values, const generator_options &options) {
    auto input = extract_input(values);
    if (!input) {
        return input.failure();
    }
    const core::currency_registry &registry = input.value().registry;
    const std::int64_t now = options.now_ms ? *options.now_ms : current_time_ms();

    core::special_case_registry special_cases(registry, now, options.sanity_window_ms);
    auto main = core::build_main_table(values, registry, special_cases);
    if (!main) {
        return main.failure();
    }
    auto others = core::build_other_currencies(registry, main.value());
    if (!others) {
        return others.failure();
    }

    currency_data data;
    data.format_version = input.value().format_version;
    data.data_version = input.value().data_version;
    data.main = std::move(main).value();
    data.special_cases = std::move(special_cases).release();
    data.other_currencies = std::move(others).value();
    return data;
}

result<currency_data> generate_from_text(std::string_view text, const generator_options &options) {
    auto values = io::parse_properties(text);
    if (!values) {
        return values.failure();
    }
    return generate(values.value(), options);
}

result<std::vector<std::uint8_t>> generate_image(std::string_view text, const generator_options &options) {
    auto data = generate_from_text(text, options);
    if (!data) {
        return data.failure();
    }
    return io::encode_image(data.value());
}

} // namespace curdata
