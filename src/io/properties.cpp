#include <curdata/io/properties.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>

namespace curdata::io {

namespace {

constexpr bool is_blank(char ch) noexcept {
    return ch == ' ' || ch == '\t' || ch == '\f';
}

constexpr bool is_line_end(char ch) noexcept {
    return ch == '\n' || ch == '\r';
}

constexpr int hex_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

void append_code_point(std::string &out, unsigned value) {
    if (value <= 0xFF) {
        out.push_back(static_cast<char>(value));
    } else if (value <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | (value >> 6)));
        out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (value >> 12)));
        out.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (value & 0x3F)));
    }
}

class line_reader {
public:
    explicit line_reader(std::string_view text) : text_(text) {}

    // Next logical line with continuations joined, or false at end of input.
    bool next(std::string &line) {
        line.clear();
        bool continuing = false;
        while (cursor_ < text_.size()) {
            skip_blanks();
            const std::size_t start = cursor_;
            while (cursor_ < text_.size() && !is_line_end(text_[cursor_])) {
                ++cursor_;
            }
            std::string_view natural = text_.substr(start, cursor_ - start);
            skip_line_end();

            if (!continuing) {
                if (natural.empty()) {
                    continue;
                }
                if (natural.front() == '#' || natural.front() == '!') {
                    continue;
                }
            }

            std::size_t trailing = 0;
            while (trailing < natural.size() && natural[natural.size() - 1 - trailing] == '\\') {
                ++trailing;
            }
            if (trailing % 2 == 1) {
                natural.remove_suffix(1);
                line.append(natural);
                continuing = true;
                continue;
            }
            line.append(natural);
            return true;
        }
        return continuing;
    }

private:
    void skip_blanks() {
        while (cursor_ < text_.size() && is_blank(text_[cursor_])) {
            ++cursor_;
        }
    }

    void skip_line_end() {
        if (cursor_ < text_.size() && text_[cursor_] == '\r') {
            ++cursor_;
            if (cursor_ < text_.size() && text_[cursor_] == '\n') {
                ++cursor_;
            }
        } else if (cursor_ < text_.size() && text_[cursor_] == '\n') {
            ++cursor_;
        }
    }

    std::string_view text_;
    std::size_t cursor_ = 0;
};

result<std::string> unescape(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t index = 0; index < raw.size(); ++index) {
        const char ch = raw[index];
        if (ch != '\\') {
            out.push_back(ch);
            continue;
        }
        if (++index == raw.size()) {
            break;
        }
        const char escaped = raw[index];
        switch (escaped) {
        case 't':
            out.push_back('\t');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'u': {
            if (index + 4 >= raw.size()) {
                return make_error(error_kind::malformed_input, "malformed \\uxxxx encoding");
            }
            unsigned value = 0;
            for (std::size_t digit = 1; digit <= 4; ++digit) {
                const int nibble = hex_value(raw[index + digit]);
                if (nibble < 0) {
                    return make_error(error_kind::malformed_input, "malformed \\uxxxx encoding");
                }
                value = (value << 4) | static_cast<unsigned>(nibble);
            }
            append_code_point(out, value);
            index += 4;
            break;
        }
        default:
            out.push_back(escaped);
            break;
        }
    }
    return out;
}

} // namespace

result<properties> parse_properties(std::string_view text) {
    properties values;
    line_reader reader(text);
    std::string line;
    while (reader.next(line)) {
        std::size_t key_end = 0;
        std::size_t value_start = line.size();
        bool has_separator = false;
        bool preceding_backslash = false;
        for (; key_end < line.size(); ++key_end) {
            const char ch = line[key_end];
            if ((ch == '=' || ch == ':') && !preceding_backslash) {
                value_start = key_end + 1;
                has_separator = true;
                break;
            }
            if (is_blank(ch) && !preceding_backslash) {
                value_start = key_end + 1;
                break;
            }
            preceding_backslash = ch == '\\' ? !preceding_backslash : false;
        }
        while (value_start < line.size()) {
            const char ch = line[value_start];
            if (!is_blank(ch)) {
                if (!has_separator && (ch == '=' || ch == ':')) {
                    has_separator = true;
                } else {
                    break;
                }
            }
            ++value_start;
        }

        auto key = unescape(std::string_view(line).substr(0, key_end));
        if (!key) {
            return key.failure();
        }
        auto value = unescape(std::string_view(line).substr(std::min(value_start, line.size())));
        if (!value) {
            return value.failure();
        }
        values.insert_or_assign(std::move(key).value(), std::move(value).value());
    }
    return values;
}

result<properties> read_properties(std::istream &input) {
    const std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        return make_error(error_kind::malformed_input, "failed to read input stream");
    }
    return parse_properties(text);
}

} // namespace curdata::io
