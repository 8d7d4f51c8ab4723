// include/curdata/curdata.hpp — Umbrella header that exposes curdata components.

#pragma once

// Users should generally include only this file.

#include <curdata/core/currency_code.hpp>
#include <curdata/core/currency_info.hpp>
#include <curdata/core/cut_over_time.hpp>
#include <curdata/core/error.hpp>
#include <curdata/core/fraction_digits.hpp>
#include <curdata/core/main_table.hpp>
#include <curdata/core/numeric_code.hpp>
#include <curdata/core/other_currencies.hpp>
#include <curdata/core/registry.hpp>
#include <curdata/core/special_cases.hpp>
#include <curdata/currency_data.hpp>
#include <curdata/format.hpp>
#include <curdata/generator.hpp>
#include <curdata/io/byte_stream.hpp>
#include <curdata/io/image.hpp>
#include <curdata/io/properties.hpp>
#include <curdata/util/dump.hpp>

namespace curdata {

inline constexpr int CURDATA_VERSION_MAJOR = 0;
inline constexpr int CURDATA_VERSION_MINOR = 1;
inline constexpr int CURDATA_VERSION_PATCH = 0;

} // namespace curdata
