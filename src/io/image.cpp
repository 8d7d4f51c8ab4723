#include <curdata/io/image.hpp>
#include <curdata/io/byte_stream.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace curdata::io {

namespace {

error malformed(std::string message) {
    return make_error(error_kind::malformed_image, std::move(message));
}

template <typename T, typename Project>
void write_ints(byte_writer &writer, const std::vector<T> &items, Project project) {
    for (const auto &item : items) {
        writer.write_int(project(item));
    }
}

result<std::size_t> read_count(byte_reader &reader, std::size_t capacity, const char *what) {
    auto count = reader.read_int();
    if (!count) {
        return count.failure();
    }
    if (count.value() < 0 || static_cast<std::size_t>(count.value()) > capacity) {
        return malformed(std::string(what) + " count out of range: " + std::to_string(count.value()));
    }
    return static_cast<std::size_t>(count.value());
}

// Reads `count` ints into a member of each record.
template <typename Record, typename Assign>
status read_ints(byte_reader &reader, std::vector<Record> &records, Assign assign) {
    for (auto &record : records) {
        auto value = reader.read_int();
        if (!value) {
            return value.failure();
        }
        assign(record, value.value());
    }
    return ok_status();
}

} // namespace

result<std::vector<std::uint8_t>> encode_image(const currency_data &data) {
    byte_writer writer;
    writer.write_int(format::MAGIC_NUMBER);
    writer.write_int(data.format_version);
    writer.write_int(data.data_version);
    for (const std::int32_t entry : data.main.packed()) {
        writer.write_int(entry);
    }

    const auto &cases = data.special_cases;
    writer.write_int(static_cast<std::int32_t>(cases.size()));
    for (const auto &record : cases) {
        writer.write_long(record.cut_over_time);
    }
    for (const auto &record : cases) {
        if (auto written = writer.write_utf(record.old_currency.code); !written) {
            return written.failure();
        }
    }
    for (const auto &record : cases) {
        const std::string_view code = record.new_currency ? std::string_view(record.new_currency->code) : "";
        if (auto written = writer.write_utf(code); !written) {
            return written.failure();
        }
    }
    write_ints(writer, cases, [](const core::special_case_record &r) { return r.old_currency.fraction_digits; });
    write_ints(writer, cases, [](const core::special_case_record &r) {
        return r.new_currency ? r.new_currency->fraction_digits : 0;
    });
    write_ints(writer, cases, [](const core::special_case_record &r) { return r.old_currency.numeric_code; });
    write_ints(writer, cases, [](const core::special_case_record &r) {
        return r.new_currency ? r.new_currency->numeric_code : 0;
    });

    const auto &others = data.other_currencies.currencies;
    writer.write_int(static_cast<std::int32_t>(others.size()));
    if (auto written = writer.write_utf(data.other_currencies.joined_codes()); !written) {
        return written.failure();
    }
    write_ints(writer, others, [](const core::currency_info &c) { return c.fraction_digits; });
    write_ints(writer, others, [](const core::currency_info &c) { return c.numeric_code; });
    return std::move(writer).release();
}

result<currency_data> decode_image(std::span<const std::uint8_t> bytes) {
    byte_reader reader(bytes);
    currency_data data;

    auto magic = reader.read_int();
    if (!magic) {
        return magic.failure();
    }
    if (magic.value() != format::MAGIC_NUMBER) {
        return malformed("bad magic number " + std::to_string(magic.value()));
    }
    auto format_version = reader.read_int();
    if (!format_version) {
        return format_version.failure();
    }
    auto data_version = reader.read_int();
    if (!data_version) {
        return data_version.failure();
    }
    data.format_version = format_version.value();
    data.data_version = data_version.value();

    for (std::size_t index = 0; index < format::MAIN_TABLE_SIZE; ++index) {
        auto packed = reader.read_int();
        if (!packed) {
            return packed.failure();
        }
        auto entry = core::unpack_entry(packed.value());
        if (!entry) {
            return entry.failure();
        }
        data.main[index] = std::move(entry).value();
    }

    auto case_count = read_count(reader, format::MAX_SPECIAL_CASES, "special case");
    if (!case_count) {
        return case_count.failure();
    }
    data.special_cases.resize(case_count.value());
    for (auto &record : data.special_cases) {
        auto time = reader.read_long();
        if (!time) {
            return time.failure();
        }
        record.cut_over_time = time.value();
    }
    for (auto &record : data.special_cases) {
        auto code = reader.read_utf();
        if (!code) {
            return code.failure();
        }
        record.old_currency.code = std::move(code).value();
    }
    for (auto &record : data.special_cases) {
        auto code = reader.read_utf();
        if (!code) {
            return code.failure();
        }
        if (!code.value().empty()) {
            record.new_currency = core::currency_info{std::move(code).value(), 0, 0};
        }
    }
    using core::special_case_record;
    if (auto digits = read_ints(reader, data.special_cases,
                                [](special_case_record &r, std::int32_t v) { r.old_currency.fraction_digits = v; });
        !digits) {
        return digits.failure();
    }
    if (auto digits = read_ints(reader, data.special_cases,
                                [](special_case_record &r, std::int32_t v) {
                                    if (r.new_currency) {
                                        r.new_currency->fraction_digits = v;
                                    }
                                });
        !digits) {
        return digits.failure();
    }
    if (auto numeric = read_ints(reader, data.special_cases,
                                 [](special_case_record &r, std::int32_t v) { r.old_currency.numeric_code = v; });
        !numeric) {
        return numeric.failure();
    }
    if (auto numeric = read_ints(reader, data.special_cases,
                                 [](special_case_record &r, std::int32_t v) {
                                     if (r.new_currency) {
                                         r.new_currency->numeric_code = v;
                                     }
                                 });
        !numeric) {
        return numeric.failure();
    }
    for (std::size_t index = 0; index < data.main.size(); ++index) {
        const auto *special = std::get_if<core::special_case_country>(&data.main[index]);
        if (special != nullptr && special->index >= data.special_cases.size()) {
            return malformed(core::main_table::country_code_at(index) + " refers to missing special case " +
                             std::to_string(special->index));
        }
    }

    auto other_count = read_count(reader, format::MAX_OTHER_CURRENCIES, "other currency");
    if (!other_count) {
        return other_count.failure();
    }
    auto joined = reader.read_utf();
    if (!joined) {
        return joined.failure();
    }
    const std::string_view codes = joined.value();
    auto &others = data.other_currencies.currencies;
    std::size_t start = 0;
    while (start < codes.size()) {
        std::size_t end = codes.find(format::OTHER_CURRENCIES_SEPARATOR, start);
        if (end == std::string_view::npos) {
            end = codes.size();
        }
        others.push_back(core::currency_info{std::string(codes.substr(start, end - start)), 0, 0});
        start = end + 1;
    }
    if (others.size() != other_count.value()) {
        return malformed("other currency list holds " + std::to_string(others.size()) + " codes, count says " +
                         std::to_string(other_count.value()));
    }
    if (auto digits = read_ints(reader, others, [](core::currency_info &c, std::int32_t v) { c.fraction_digits = v; });
        !digits) {
        return digits.failure();
    }
    if (auto numeric = read_ints(reader, others, [](core::currency_info &c, std::int32_t v) { c.numeric_code = v; });
        !numeric) {
        return numeric.failure();
    }
    if (!reader.at_end()) {
        return malformed(std::to_string(reader.remaining()) + " trailing bytes after image");
    }
    return data;
}

status write_image(std::ostream &out, std::span<const std::uint8_t> bytes) {
    out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        return make_error(error_kind::output_write_failure, "failed writing currency data image");
    }
    return ok_status();
}

} // namespace curdata::io
