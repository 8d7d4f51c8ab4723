// src/cli/generate_currency_data.cpp — Reads currency properties on stdin, writes the binary image.

#include <fstream>
#include <iostream>
#include <string_view>

#include <curdata/curdata.hpp>

namespace {

int fail(const curdata::error &failure) {
    std::cerr << "Error: " << curdata::to_string(failure.kind) << ": " << failure.message << "\n";
    return 1;
}

} // namespace

int
main(int argc, char **argv) {
    if (argc != 3 || std::string_view(argv[1]) != "-o") {
        std::cerr << "Error: Illegal arg count\n";
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "generate_currency_data") << " -o <output file>\n";
        return 1;
    }

    std::ofstream out(argv[2], std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Error: cannot open " << argv[2] << " for writing\n";
        return 1;
    }

    auto values = curdata::io::read_properties(std::cin);
    if (!values) {
        return fail(values.failure());
    }
    auto data = curdata::generate(values.value());
    if (!data) {
        return fail(data.failure());
    }
    auto image = curdata::io::encode_image(data.value());
    if (!image) {
        return fail(image.failure());
    }
    if (auto written = curdata::io::write_image(out, image.value()); !written) {
        return fail(written.failure());
    }
    out.close();
    if (!out) {
        return fail(curdata::make_error(curdata::error_kind::output_write_failure, "failed closing output"));
    }
    return 0;
}
