//! # Scan Cursor Implementation
//!
//! UTF-8 decoding and the primitive cursor operations.

#include "jsonast/json/json_cursor.hpp"

namespace jsonast::json {

// ============================================================================
// UTF-8 Helpers
// ============================================================================

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto describe_char(char32_t c) -> std::string {
    if (c == END_OF_INPUT) {
        return "end of file";
    }
    std::string out;
    append_utf8(out, c);
    return out;
}

// ============================================================================
// Cursor
// ============================================================================

/// Decodes one UTF-8 sequence starting at `at`.
///
/// Overlong forms, encoded surrogates, code points above U+10FFFF and
/// truncated sequences all decode to `REPLACEMENT_CHARACTER` with width 1.
auto Cursor::decode(size_t at, size_t& width) const -> char32_t {
    if (at >= text_.size()) {
        width = 0;
        return END_OF_INPUT;
    }

    auto byte = [this](size_t i) -> unsigned char { return static_cast<unsigned char>(text_[i]); };

    unsigned char b0 = byte(at);
    if (b0 < 0x80) {
        width = 1;
        return b0;
    }

    size_t len = 0;
    char32_t cp = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
        cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        cp = b0 & 0x0F;
        if (b0 == 0xE0) {
            lo = 0xA0;
        } else if (b0 == 0xED) {
            hi = 0x9F;
        }
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        cp = b0 & 0x07;
        if (b0 == 0xF0) {
            lo = 0x90;
        } else if (b0 == 0xF4) {
            hi = 0x8F;
        }
    } else {
        width = 1;
        return REPLACEMENT_CHARACTER;
    }

    if (at + len > text_.size()) {
        width = 1;
        return REPLACEMENT_CHARACTER;
    }

    for (size_t i = 1; i < len; ++i) {
        unsigned char b = byte(at + i);
        unsigned char min = i == 1 ? lo : 0x80;
        unsigned char max = i == 1 ? hi : 0xBF;
        if (b < min || b > max) {
            width = 1;
            return REPLACEMENT_CHARACTER;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    width = len;
    return cp;
}

auto Cursor::current() const -> char32_t {
    size_t width = 0;
    return decode(offset_, width);
}

auto Cursor::current_width() const -> size_t {
    size_t width = 0;
    (void)decode(offset_, width);
    return width;
}

void Cursor::advance() {
    offset_ += current_width();
}

auto Cursor::expect(char32_t expected, JsonErrorKind kind) -> std::optional<JsonError> {
    char32_t c = current();
    if (c != expected) {
        return error(kind, "expected " + describe_char(expected) + " but got " + describe_char(c) +
                               " at " + std::to_string(offset_));
    }
    advance();
    return std::nullopt;
}

void Cursor::skip_whitespace() {
    while (is_whitespace(current())) {
        advance();
    }
}

} // namespace jsonast::json
