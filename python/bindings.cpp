// python/bindings.cpp — Pybind11 bindings for the curdata generator and image reader.

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <curdata/curdata.hpp>

namespace py = pybind11;

namespace {

template <typename T>
T unwrap(curdata::result<T> value) {
    if (!value) {
        const auto &failure = value.failure();
        throw py::value_error(std::string(curdata::to_string(failure.kind)) + ": " + failure.message);
    }
    return std::move(value).value();
}

curdata::generator_options make_options(std::optional<std::int64_t> now_ms) {
    curdata::generator_options options;
    options.now_ms = now_ms;
    return options;
}

py::dict currency_dict(const curdata::core::currency_info &info) {
    py::dict out;
    out["code"] = info.code;
    out["fraction_digits"] = info.fraction_digits;
    out["numeric_code"] = info.numeric_code;
    return out;
}

py::dict data_dict(const curdata::currency_data &data) {
    py::dict out;
    out["format_version"] = data.format_version;
    out["data_version"] = data.data_version;

    py::dict countries;
    for (std::size_t index = 0; index < data.main.size(); ++index) {
        const auto &entry = data.main[index];
        if (curdata::core::tag_of(entry) != curdata::core::entry_tag::invalid) {
            std::ostringstream text;
            curdata::util::dump(text, entry);
            countries[py::str(curdata::core::main_table::country_code_at(index))] = text.str();
        }
    }
    out["countries"] = countries;

    py::list special;
    for (const auto &record : data.special_cases) {
        py::dict item;
        item["cut_over_time"] = record.cut_over_time;
        item["old"] = currency_dict(record.old_currency);
        if (record.new_currency) {
            item["new"] = currency_dict(*record.new_currency);
        } else {
            item["new"] = py::none();
        }
        special.append(item);
    }
    out["special_cases"] = special;

    py::list others;
    for (const auto &info : data.other_currencies.currencies) {
        others.append(currency_dict(info));
    }
    out["other_currencies"] = others;
    return out;
}

} // namespace

PYBIND11_MODULE(curdata, module) {
    module.doc() = "Python bindings for the curdata currency image generator";

    module.attr("MAGIC_NUMBER") = curdata::format::MAGIC_NUMBER;

    module.def(
        "generate",
        [](const std::string &text, std::optional<std::int64_t> now_ms) {
            const auto bytes = unwrap(curdata::generate_image(text, make_options(now_ms)));
            return py::bytes(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        },
        py::arg("text"), py::arg("now_ms") = py::none(),
        "Builds the binary image from CurrencyData.properties text.");

    module.def(
        "describe",
        [](const std::string &text, std::optional<std::int64_t> now_ms) {
            return data_dict(unwrap(curdata::generate_from_text(text, make_options(now_ms))));
        },
        py::arg("text"), py::arg("now_ms") = py::none(),
        "Builds the tables without encoding and returns them as plain Python objects.");

    module.def(
        "decode",
        [](const py::bytes &image) {
            const std::string raw = image;
            const std::vector<std::uint8_t> bytes(raw.begin(), raw.end());
            return data_dict(unwrap(curdata::io::decode_image(bytes)));
        },
        py::arg("image"), "Parses a binary image back into its tables.");
}
