// include/curdata/format.hpp — Constants shared by the encoder and the runtime currency reader.

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace curdata::format {

// 'CurD'
inline constexpr std::int32_t MAGIC_NUMBER = 0x43757244;

inline constexpr int A_TO_Z = ('Z' - 'A') + 1;
inline constexpr std::size_t MAIN_TABLE_SIZE = static_cast<std::size_t>(A_TO_Z * A_TO_Z);

inline constexpr std::int32_t INVALID_COUNTRY_ENTRY = 0x007F;
inline constexpr std::int32_t COUNTRY_WITHOUT_CURRENCY_ENTRY = 0x0080;

inline constexpr std::int32_t SIMPLE_CASE_COUNTRY_MASK = 0x0000;
inline constexpr std::int32_t SIMPLE_CASE_COUNTRY_FINAL_CHAR_MASK = 0x001F;
inline constexpr std::int32_t SIMPLE_CASE_COUNTRY_DEFAULT_DIGITS_MASK = 0x0060;
inline constexpr int SIMPLE_CASE_COUNTRY_DEFAULT_DIGITS_SHIFT = 5;

inline constexpr std::int32_t SPECIAL_CASE_COUNTRY_MASK = 0x0080;
inline constexpr std::int32_t SPECIAL_CASE_COUNTRY_INDEX_MASK = 0x001F;
// Index component 0 is taken by COUNTRY_WITHOUT_CURRENCY_ENTRY.
inline constexpr std::int32_t SPECIAL_CASE_COUNTRY_INDEX_DELTA = 1;

inline constexpr std::int32_t NUMERIC_CODE_MASK = 0x0003FF00;
inline constexpr int NUMERIC_CODE_SHIFT = 8;
inline constexpr int MAX_NUMERIC_CODE = 999;

inline constexpr int MAX_SIMPLE_FRACTION_DIGITS = 3;
inline constexpr int UNDEFINED_FRACTION_DIGITS = -1;
inline constexpr int DEFAULT_FRACTION_DIGITS = 2;

// Bounded by SPECIAL_CASE_COUNTRY_INDEX_MASK once the delta is added.
inline constexpr std::size_t MAX_SPECIAL_CASES = 30;
inline constexpr std::size_t MAX_OTHER_CURRENCIES = 70;

inline constexpr std::int64_t NEVER_CUT_OVER = std::numeric_limits<std::int64_t>::max();

// "all" entry: three letters, three digits, one separator.
inline constexpr std::size_t REGISTRY_RECORD_WIDTH = 7;
inline constexpr char REGISTRY_SEPARATOR = '-';
inline constexpr char OTHER_CURRENCIES_SEPARATOR = '-';
inline constexpr char SPECIAL_CASE_SEPARATOR = ';';

// Largest byte count a length-prefixed string may carry.
inline constexpr std::size_t MAX_UTF_LENGTH = 0xFFFF;

static_assert(MAX_SPECIAL_CASES + SPECIAL_CASE_COUNTRY_INDEX_DELTA <=
                  static_cast<std::size_t>(SPECIAL_CASE_COUNTRY_INDEX_MASK),
              "special case index must fit its field");
static_assert((MAX_NUMERIC_CODE << NUMERIC_CODE_SHIFT) <= NUMERIC_CODE_MASK,
              "numeric code must fit its field");

} // namespace curdata::format
