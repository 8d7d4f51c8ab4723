// include/curdata/io/image.hpp — Serialization of currency_data to the fixed big-endian layout.

#pragma once

#include <cstdint>
#include <ostream>
#include <span>
#include <vector>

#include <curdata/core/error.hpp>
#include <curdata/currency_data.hpp>

namespace curdata::io {

// Layout, all integers big-endian:
//   magic, formatVersion, dataVersion            int32
//   mainTable                                    int32[676]
//   specialCaseCount                             int32
//   cut-over times                               int64[n]
//   old codes, new codes ("" if none)            utf[n] each
//   old digits, new digits, old/new numeric      int32[n] each
//   otherCurrenciesCount                         int32
//   other codes, dash separated                  utf
//   other digits, other numeric                  int32[m] each
result<std::vector<std::uint8_t>> encode_image(const currency_data &data);

// Rejects bad magic, truncation, trailing bytes and undecodable entries.
result<currency_data> decode_image(std::span<const std::uint8_t> bytes);

status write_image(std::ostream &out, std::span<const std::uint8_t> bytes);

} // namespace curdata::io
