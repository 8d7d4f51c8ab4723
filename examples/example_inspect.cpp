// examples/example_inspect.cpp — Decodes a generated currency image and lists its tables.

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>

#include <curdata/curdata.hpp>

int
main(int argc, char **argv) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <currency.data>\n";
        return 1;
    }
    std::ifstream input(argv[1], std::ios::binary);
    if (!input) {
        std::cerr << "cannot open " << argv[1] << "\n";
        return 1;
    }
    const std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};

    const auto data = curdata::io::decode_image(bytes);
    if (!data) {
        std::cerr << curdata::to_string(data.failure().kind) << ": " << data.failure().message << "\n";
        return 1;
    }
    curdata::util::dump(std::cout, data.value());

    // Look a few countries up the way the runtime reader does.
    for (const char *country : {"US", "HR", "AQ", "QQ"}) {
        std::cout << country << " -> ";
        curdata::util::dump(std::cout, data.value().main.at(country)) << "\n";
    }
    return 0;
}
