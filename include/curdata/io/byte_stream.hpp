// include/curdata/io/byte_stream.hpp — Big-endian primitives for the binary currency image.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <curdata/core/error.hpp>
#include <curdata/format.hpp>

namespace curdata::io {

class byte_writer {
public:
    void write_int(std::int32_t value) {
        write_big_endian(static_cast<std::uint64_t>(static_cast<std::uint32_t>(value)), 4);
    }

    void write_long(std::int64_t value) {
        write_big_endian(static_cast<std::uint64_t>(value), 8);
    }

    // Length-prefixed modified UTF-8; each input byte is one Latin-1 character.
    status write_utf(std::string_view text) {
        std::size_t encoded = 0;
        for (const char ch : text) {
            encoded += encoded_width(static_cast<unsigned char>(ch));
        }
        if (encoded > format::MAX_UTF_LENGTH) {
            return make_error(error_kind::output_write_failure,
                              "encoded string too long: " + std::to_string(encoded) + " bytes");
        }
        write_big_endian(encoded, 2);
        for (const char ch : text) {
            const auto unit = static_cast<unsigned char>(ch);
            if (encoded_width(unit) == 1) {
                bytes_.push_back(unit);
            } else {
                bytes_.push_back(static_cast<std::uint8_t>(0xC0 | (unit >> 6)));
                bytes_.push_back(static_cast<std::uint8_t>(0x80 | (unit & 0x3F)));
            }
        }
        return ok_status();
    }

    const std::vector<std::uint8_t> &bytes() const noexcept {
        return bytes_;
    }

    std::vector<std::uint8_t> release() && {
        return std::move(bytes_);
    }

private:
    static constexpr std::size_t encoded_width(unsigned char unit) noexcept {
        return (unit >= 0x01 && unit <= 0x7F) ? 1 : 2;
    }

    void write_big_endian(std::uint64_t value, int width) {
        for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
        }
    }

    std::vector<std::uint8_t> bytes_;
};

class byte_reader {
public:
    explicit byte_reader(std::span<const std::uint8_t> bytes) noexcept : bytes_(bytes) {}

    result<std::int32_t> read_int() {
        std::uint64_t value = 0;
        if (!read_big_endian(4, value)) {
            return truncated("int");
        }
        return static_cast<std::int32_t>(static_cast<std::uint32_t>(value));
    }

    result<std::int64_t> read_long() {
        std::uint64_t value = 0;
        if (!read_big_endian(8, value)) {
            return truncated("long");
        }
        return static_cast<std::int64_t>(value);
    }

    // Inverse of byte_writer::write_utf; characters above 0xFF are rejected.
    result<std::string> read_utf() {
        std::uint64_t length = 0;
        if (!read_big_endian(2, length)) {
            return truncated("string length");
        }
        if (remaining() < length) {
            return truncated("string");
        }
        std::string text;
        const std::size_t end = offset_ + static_cast<std::size_t>(length);
        while (offset_ < end) {
            const std::uint8_t lead = bytes_[offset_++];
            if (lead < 0x80) {
                if (lead == 0) {
                    return malformed("raw NUL in string");
                }
                text.push_back(static_cast<char>(lead));
                continue;
            }
            if ((lead & 0xE0) != 0xC0 || offset_ == end) {
                return malformed("unsupported modified UTF-8 sequence");
            }
            const std::uint8_t trail = bytes_[offset_++];
            if ((trail & 0xC0) != 0x80) {
                return malformed("bad continuation byte");
            }
            const unsigned value = ((lead & 0x1Fu) << 6) | (trail & 0x3Fu);
            if (value > 0xFF) {
                return malformed("character outside Latin-1");
            }
            text.push_back(static_cast<char>(value));
        }
        return text;
    }

    std::size_t offset() const noexcept {
        return offset_;
    }

    std::size_t remaining() const noexcept {
        return bytes_.size() - offset_;
    }

    bool at_end() const noexcept {
        return offset_ == bytes_.size();
    }

private:
    bool read_big_endian(std::size_t width, std::uint64_t &value) {
        if (remaining() < width) {
            return false;
        }
        value = 0;
        for (std::size_t index = 0; index < width; ++index) {
            value = (value << 8) | bytes_[offset_++];
        }
        return true;
    }

    error truncated(const char *what) const {
        return make_error(error_kind::malformed_image,
                          std::string("image truncated reading ") + what + " at offset " + std::to_string(offset_));
    }

    error malformed(const char *what) const {
        return make_error(error_kind::malformed_image,
                          std::string(what) + " at offset " + std::to_string(offset_));
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t offset_ = 0;
};

} // namespace curdata::io
