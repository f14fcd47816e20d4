//! # Scalar Recognizers
//!
//! Recognizers for the productions that contain no nested values:
//! strings, numbers, `true`/`false` and `null`.
//!
//! Each one runs its own `Cursor` from the given offset and builds its
//! payload in local buffers, emitting the node once at the end.

#include "jsonast/json/json_parser.hpp"

namespace jsonast::json {

namespace {

/// Resolves the escape sequence after a consumed backslash.
///
/// Appends the decoded text to `content` and leaves the cursor after the
/// sequence.
auto scan_escape(Cursor& cursor, std::string& content) -> std::optional<JsonError> {
    char32_t c = cursor.current();
    switch (c) {
    case U'"':
        content += '"';
        break;
    case U'\\':
        content += '\\';
        break;
    case U'/':
        content += '/';
        break;
    case U'b':
        content += '\b';
        break;
    case U'f':
        content += '\f';
        break;
    case U'n':
        content += '\n';
        break;
    case U'r':
        content += '\r';
        break;
    case U't':
        content += '\t';
        break;
    case U'u': {
        cursor.advance();
        char32_t unit = 0;
        for (int i = 0; i < 4; ++i) {
            char32_t h = cursor.current();
            if (!is_hex_digit(h)) {
                return cursor.error(JsonErrorKind::InvalidEscape,
                                    "invalid unicode escape: " + describe_char(h));
            }
            unit = unit * 16 +
                   (is_digit(h) ? h - U'0' : (h >= U'a' ? h - U'a' + 10 : h - U'A' + 10));
            cursor.advance();
        }
        append_utf8(content, unit);
        return std::nullopt;
    }
    default:
        return cursor.error(JsonErrorKind::InvalidEscape,
                            "invalid escape character: " + describe_char(c));
    }
    cursor.advance();
    return std::nullopt;
}

/// Consumes a run of digits and returns it.
auto scan_digits(Cursor& cursor) -> std::string_view {
    size_t from = cursor.offset();
    while (is_digit(cursor.current())) {
        cursor.advance();
    }
    return cursor.slice_from(from);
}

/// Consumes each character of `rest` in order.
auto expect_literal(Cursor& cursor, std::u32string_view rest) -> std::optional<JsonError> {
    for (char32_t c : rest) {
        if (auto err = cursor.expect(c, JsonErrorKind::InvalidLiteral)) {
            return err;
        }
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// String
// ============================================================================

auto scan_string(std::string_view text, size_t offset) -> Result<AstNode, JsonError> {
    Cursor cursor(text, offset);
    if (auto err = cursor.expect(U'"')) {
        return *err;
    }

    std::string content;
    while (true) {
        // Copy plain characters in runs
        size_t run = cursor.offset();
        char32_t c = cursor.current();
        while (c != U'"' && c != U'\\' && c != END_OF_INPUT) {
            cursor.advance();
            c = cursor.current();
        }
        content += cursor.slice_from(run);

        if (c == U'"') {
            break;
        }
        if (c == END_OF_INPUT) {
            return cursor.error(JsonErrorKind::UnterminatedString, "unterminated string");
        }

        cursor.advance(); // Skip backslash
        if (auto err = scan_escape(cursor, content)) {
            return *err;
        }
    }

    cursor.advance(); // Skip closing quote
    return AstNode{cursor.start(), cursor.offset(), AstString{std::move(content)}};
}

// ============================================================================
// Number
// ============================================================================

auto scan_number(std::string_view text, size_t offset) -> Result<AstNode, JsonError> {
    Cursor cursor(text, offset);
    AstNumber number;

    if (cursor.current() == U'-') {
        number.negative = true;
        cursor.advance();
    }

    // Integer part: a lone 0, or a non-zero digit followed by digits
    char32_t c = cursor.current();
    if (c == U'0') {
        cursor.advance();
        number.integer = "0";
        if (is_digit(cursor.current())) {
            return cursor.error(JsonErrorKind::InvalidNumber, "invalid number");
        }
    } else if (is_digit_nonzero(c)) {
        number.integer = scan_digits(cursor);
    } else {
        return cursor.error(JsonErrorKind::InvalidNumber, "invalid number");
    }

    if (cursor.current() == U'.') {
        cursor.advance();
        if (!is_digit(cursor.current())) {
            return cursor.error(JsonErrorKind::InvalidNumber, "invalid fractional parameter");
        }
        number.fraction = scan_digits(cursor);
    }

    c = cursor.current();
    if (c == U'e' || c == U'E') {
        cursor.advance();
        c = cursor.current();
        if (c == U'-') {
            number.exponent_negative = true;
            cursor.advance();
        } else if (c == U'+') {
            cursor.advance();
        }
        if (!is_digit(cursor.current())) {
            return cursor.error(JsonErrorKind::InvalidNumber, "invalid exponent parameter");
        }
        number.exponent = scan_digits(cursor);
    }

    return AstNode{cursor.start(), cursor.offset(), std::move(number)};
}

// ============================================================================
// Literals
// ============================================================================

auto scan_boolean(std::string_view text, size_t offset) -> Result<AstNode, JsonError> {
    Cursor cursor(text, offset);
    bool value = false;

    char32_t c = cursor.current();
    if (c == U't') {
        cursor.advance();
        if (auto err = expect_literal(cursor, U"rue")) {
            return *err;
        }
        value = true;
    } else if (c == U'f') {
        cursor.advance();
        if (auto err = expect_literal(cursor, U"alse")) {
            return *err;
        }
    } else {
        return cursor.error(JsonErrorKind::InvalidLiteral, "invalid boolean");
    }

    return AstNode{cursor.start(), cursor.offset(), AstBoolean{value}};
}

auto scan_null(std::string_view text, size_t offset) -> Result<AstNode, JsonError> {
    Cursor cursor(text, offset);
    if (auto err = expect_literal(cursor, U"null")) {
        return *err;
    }
    return AstNode{cursor.start(), cursor.offset(), AstNull{}};
}

} // namespace jsonast::json
