// include/curdata/io/properties.hpp — Reader for the properties text the currency table is kept in.

#pragma once

#include <istream>
#include <string>
#include <string_view>

#include <curdata/core/error.hpp>
#include <curdata/core/main_table.hpp>

namespace curdata::io {

using properties = core::string_map;

// Input bytes are taken as Latin-1 characters and kept as is; a \uXXXX escape
// above 0xFF is stored as UTF-8.
result<properties> parse_properties(std::string_view text);

result<properties> read_properties(std::istream &input);

} // namespace curdata::io
