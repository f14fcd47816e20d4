//! # JSON Error Types
//!
//! This module provides the error type returned by every fallible parsing
//! operation. Errors carry the byte offset where the grammar was violated
//! plus the line and column derived from it.
//!
//! ## Error Kinds
//!
//! | Kind | Raised by | Example message |
//! |------|-----------|-----------------|
//! | `UnexpectedCharacter` | `Cursor::expect` | `expected ] but got end of file at 5` |
//! | `InvalidValue` | Value dispatcher | `invalid value` |
//! | `UnterminatedString` | String recognizer | `unterminated string` |
//! | `InvalidEscape` | String recognizer | `invalid escape character: x` |
//! | `InvalidNumber` | Number recognizer | `invalid fractional parameter` |
//! | `InvalidLiteral` | Boolean/null recognizers | `expected u but got x at 1` |
//! | `TrailingContent` | Top-level driver | `unexpected character at 7` |
//! | `DepthExceeded` | Value dispatcher | `maximum nesting depth exceeded` |
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json("[1,]");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//!     // Output: "line 1, column 4: invalid value"
//! }
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace jsonast::json {

/// Classification of grammar violations.
enum class JsonErrorKind : uint8_t {
    UnexpectedCharacter, ///< A specific character (or end of input) was required
    InvalidValue,        ///< Lookahead cannot start any value
    UnterminatedString,  ///< End of input inside an open string
    InvalidEscape,       ///< Unknown escape or malformed `\u` sequence
    InvalidNumber,       ///< Leading zero, or empty fraction/exponent digits
    InvalidLiteral,      ///< Mismatch inside `true`, `false` or `null`
    TrailingContent,     ///< Non-whitespace after the top-level value
    DepthExceeded        ///< Nesting deeper than `ParseOptions::max_depth`
};

/// Returns a short name for an error kind (e.g., `"invalid-number"`).
[[nodiscard]] inline auto error_kind_name(JsonErrorKind kind) -> const char* {
    switch (kind) {
    case JsonErrorKind::UnexpectedCharacter:
        return "unexpected-character";
    case JsonErrorKind::InvalidValue:
        return "invalid-value";
    case JsonErrorKind::UnterminatedString:
        return "unterminated-string";
    case JsonErrorKind::InvalidEscape:
        return "invalid-escape";
    case JsonErrorKind::InvalidNumber:
        return "invalid-number";
    case JsonErrorKind::InvalidLiteral:
        return "invalid-literal";
    case JsonErrorKind::TrailingContent:
        return "trailing-content";
    case JsonErrorKind::DepthExceeded:
        return "depth-exceeded";
    }
    return "unknown";
}

/// An error encountered while parsing JSON text.
///
/// # Fields
///
/// - `kind`: Which grammar rule was violated
/// - `message`: Description of what went wrong
/// - `line`: 1-based line number (0 if unknown)
/// - `column`: 1-based column number in bytes (0 if unknown)
/// - `offset`: Byte offset from start of input
///
/// # Example
///
/// ```cpp
/// auto error = JsonError::at(JsonErrorKind::InvalidNumber, "invalid number", text, 3);
/// if (error.line > 0) {
///     std::cerr << "Error at line " << error.line << std::endl;
/// }
/// ```
struct JsonError {
    /// What kind of violation this is.
    JsonErrorKind kind = JsonErrorKind::InvalidValue;

    /// Human-readable error description.
    std::string message;

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in input where the error occurred.
    size_t offset = 0;

    /// Creates an error with message only.
    ///
    /// Use this when location information is not available.
    static auto make(JsonErrorKind kind, std::string msg) -> JsonError {
        return JsonError{kind, std::move(msg), 0, 0, 0};
    }

    /// Creates an error located at `offset` in `text`.
    ///
    /// Line and column are computed by scanning `text` up to `offset`.
    /// Offsets past the end are clamped to the end of the text.
    ///
    /// # Arguments
    ///
    /// * `kind` - The violated rule
    /// * `msg` - The error message
    /// * `text` - The complete input being parsed
    /// * `offset` - Byte offset of the offending character
    static auto at(JsonErrorKind kind, std::string msg, std::string_view text, size_t offset)
        -> JsonError {
        size_t limit = offset < text.size() ? offset : text.size();
        size_t line = 1;
        size_t line_start = 0;
        for (size_t i = 0; i < limit; ++i) {
            if (text[i] == '\n') {
                ++line;
                line_start = i + 1;
            }
        }
        return JsonError{kind, std::move(msg), line, offset - line_start + 1, offset};
    }

    /// Formats the error as a human-readable string.
    ///
    /// The format depends on available location information:
    /// - With line and column: `"line X, column Y: message"`
    /// - With line only: `"line X: message"`
    /// - Without location: `"message"`
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace jsonast::json
