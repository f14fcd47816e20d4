//! # Scan Cursor
//!
//! The cursor is the mutable scan position shared by every recognizer, plus
//! the character classifiers the grammar is written in terms of.
//!
//! ## Characters
//!
//! Input is UTF-8. A "character" is one decoded code point; `advance()`
//! steps over its whole byte sequence. Malformed sequences decode to
//! U+FFFD and are one byte wide, so scanning always makes progress.
//! Offsets are byte offsets.
//!
//! ## Whitespace
//!
//! `is_whitespace` accepts the wide set used between values:
//! `\f \n \r \t \v`, space, U+00A0, U+1680, U+2000-U+200A, U+2028, U+2029,
//! U+202F, U+205F, U+3000 and U+FEFF.
//!
//! ## Example
//!
//! ```cpp
//! Cursor cursor("  [1]");
//! cursor.skip_whitespace();           // offset() == 2
//! if (auto err = cursor.expect('[')) {
//!     return *err;
//! }
//! ```

#pragma once

#include "jsonast/json/json_ast.hpp"
#include "jsonast/json/json_error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace jsonast::json {

// ============================================================================
// Character Classifiers
// ============================================================================

/// Sentinel returned by `Cursor::current()` at end of input.
constexpr char32_t END_OF_INPUT = 0xFFFFFFFFu;

/// Replacement character produced for malformed UTF-8.
constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFDu;

/// Returns `true` for code points skipped between values.
[[nodiscard]] constexpr auto is_whitespace(char32_t c) -> bool {
    switch (c) {
    case U'\f':
    case U'\n':
    case U'\r':
    case U'\t':
    case U'\v':
    case U' ':
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
    case 0xFEFF:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}

/// Returns `true` for `0`-`9`.
[[nodiscard]] constexpr auto is_digit(char32_t c) -> bool {
    return c >= U'0' && c <= U'9';
}

/// Returns `true` for `1`-`9`.
[[nodiscard]] constexpr auto is_digit_nonzero(char32_t c) -> bool {
    return c >= U'1' && c <= U'9';
}

/// Returns `true` for `0`-`9`, `a`-`f` and `A`-`F`.
[[nodiscard]] constexpr auto is_hex_digit(char32_t c) -> bool {
    return is_digit(c) || (c >= U'a' && c <= U'f') || (c >= U'A' && c <= U'F');
}

/// Returns `true` if `c` can begin a JSON value.
[[nodiscard]] constexpr auto can_start_value(char32_t c) -> bool {
    return c == U'{' || c == U'[' || c == U'"' || c == U'-' || c == U't' || c == U'f' ||
           c == U'n' || is_digit(c);
}

/// Appends the UTF-8 encoding of `cp` to `out`.
///
/// Values up to U+FFFF (surrogates included) use at most three bytes.
void append_utf8(std::string& out, char32_t cp);

/// Renders a character for error messages; `END_OF_INPUT` becomes `"end of file"`.
[[nodiscard]] auto describe_char(char32_t c) -> std::string;

// ============================================================================
// Cursor
// ============================================================================

/// A scan position over an input text.
///
/// Recognizers never move the offset by hand. They step with `advance()`
/// and `expect()`, or delegate a nested production to another recognizer
/// and then `snap_to()` the node it returned.
class Cursor {
public:
    /// Creates a cursor over `text` positioned at `offset`.
    ///
    /// `start()` remembers the initial offset for the node being built.
    explicit Cursor(std::string_view text, size_t offset = 0)
        : text_(text), offset_(offset), start_(offset) {}

    /// Returns the character at the offset, or `END_OF_INPUT`.
    [[nodiscard]] auto current() const -> char32_t;

    /// Returns `true` when the offset is at or past the end of the text.
    [[nodiscard]] auto at_end() const -> bool { return offset_ >= text_.size(); }

    /// Moves past the current character. Does nothing at end of input.
    void advance();

    /// Consumes `expected` or reports what was found instead.
    ///
    /// # Returns
    ///
    /// `std::nullopt` on success; otherwise an error of kind `kind` with the
    /// message `expected X but got Y at N` (or `... end of file at N`).
    [[nodiscard]] auto expect(char32_t expected,
                              JsonErrorKind kind = JsonErrorKind::UnexpectedCharacter)
        -> std::optional<JsonError>;

    /// Advances over every character accepted by `is_whitespace`.
    void skip_whitespace();

    /// Moves the offset to the end of a node produced by a sub-recognizer.
    void snap_to(const AstNode& node) { offset_ = node.end; }

    /// Byte length of the current character (0 at end of input).
    [[nodiscard]] auto current_width() const -> size_t;

    /// Bytes from `from` up to the current offset.
    [[nodiscard]] auto slice_from(size_t from) const -> std::string_view {
        return text_.substr(from, offset_ - from);
    }

    /// Creates an error of the given kind at the current offset.
    [[nodiscard]] auto error(JsonErrorKind kind, std::string msg) const -> JsonError {
        return JsonError::at(kind, std::move(msg), text_, offset_);
    }

    [[nodiscard]] auto offset() const -> size_t { return offset_; }
    [[nodiscard]] auto start() const -> size_t { return start_; }
    [[nodiscard]] auto text() const -> std::string_view { return text_; }

private:
    std::string_view text_;
    size_t offset_;
    size_t start_;

    /// Decodes the UTF-8 sequence at `at`; stores its byte length in `width`.
    [[nodiscard]] auto decode(size_t at, size_t& width) const -> char32_t;
};

} // namespace jsonast::json
