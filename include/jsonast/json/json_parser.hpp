//! # JSON Parser
//!
//! Strict recursive descent parser producing a position-annotated syntax
//! tree. It accepts exactly the RFC 8259 grammar: no comments, no trailing
//! commas, no leading zeros or `+` signs, no bare or trailing dots.
//!
//! ## Structure
//!
//! Each grammar production has its own recognizer. A recognizer starts at a
//! given offset, consumes exactly its production, and returns one node whose
//! `end` is the offset just past what it consumed. Recognizers for nested
//! values call back into the value dispatcher.
//!
//! | Recognizer | Production | Lookahead |
//! |------------|------------|-----------|
//! | `scan_object` | `{ "key": value, ... }` | `{` |
//! | `scan_array` | `[ value, ... ]` | `[` |
//! | `scan_string` | `"..."` | `"` |
//! | `scan_number` | `-?int frac? exp?` | `-`, digit |
//! | `scan_boolean` | `true`, `false` | `t`, `f` |
//! | `scan_null` | `null` | `n` |
//!
//! ## Example
//!
//! ```cpp
//! #include "jsonast/json/json_parser.hpp"
//! using namespace jsonast;
//! using namespace jsonast::json;
//!
//! auto result = parse_json(R"({"name": "Alice", "tags": ["a", "b"]})");
//! if (is_ok(result)) {
//!     const AstNode& root = unwrap(result);
//!     for (const auto& prop : root.as_object().properties) {
//!         std::cout << prop.key_content() << " @ " << prop.start << "\n";
//!     }
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "jsonast/common.hpp"
#include "jsonast/json/json_ast.hpp"
#include "jsonast/json/json_cursor.hpp"
#include "jsonast/json/json_error.hpp"

#include <cstddef>
#include <string_view>

namespace jsonast::json {

/// Parser configuration.
struct ParseOptions {
    /// Maximum container nesting depth; 0 means unlimited.
    ///
    /// With the default the only bound is the call stack, so very deep input
    /// can exhaust it. A non-zero limit rejects deeper documents with
    /// `JsonErrorKind::DepthExceeded`.
    size_t max_depth = 0;
};

// ============================================================================
// Recognizers
// ============================================================================

/// Recognizes a string literal starting at `offset`.
///
/// Resolves `\" \\ \/ \b \f \n \r \t` and `\uXXXX`. A `\u` escape yields the
/// single 16-bit code unit it names; surrogate pairs are not combined.
[[nodiscard]] auto scan_string(std::string_view text, size_t offset)
    -> Result<AstNode, JsonError>;

/// Recognizes a number starting at `offset`, keeping its lexical parts.
[[nodiscard]] auto scan_number(std::string_view text, size_t offset)
    -> Result<AstNode, JsonError>;

/// Recognizes `true` or `false` starting at `offset`.
[[nodiscard]] auto scan_boolean(std::string_view text, size_t offset)
    -> Result<AstNode, JsonError>;

/// Recognizes `null` starting at `offset`.
[[nodiscard]] auto scan_null(std::string_view text, size_t offset)
    -> Result<AstNode, JsonError>;

/// Recognizes an object starting at `offset`.
///
/// `depth` is the number of containers already open around this one.
[[nodiscard]] auto scan_object(std::string_view text, size_t offset,
                               const ParseOptions& options = {}, size_t depth = 0)
    -> Result<AstNode, JsonError>;

/// Recognizes an array starting at `offset`.
///
/// `depth` is the number of containers already open around this one.
[[nodiscard]] auto scan_array(std::string_view text, size_t offset,
                              const ParseOptions& options = {}, size_t depth = 0)
    -> Result<AstNode, JsonError>;

// ============================================================================
// Value Dispatcher
// ============================================================================

/// Parses one value at the cursor.
///
/// Skips leading whitespace, picks a recognizer from the lookahead, moves
/// the cursor to the end of the produced node, then skips trailing
/// whitespace. Fails with `invalid value` when no recognizer applies.
///
/// # Arguments
///
/// * `cursor` - Position to read from; advanced past the value and whitespace
/// * `options` - Parser configuration
/// * `depth` - Number of containers enclosing the value
[[nodiscard]] auto parse_value(Cursor& cursor, const ParseOptions& options = {},
                               size_t depth = 0) -> Result<AstNode, JsonError>;

/// Parses one value starting at `offset`, whitespace on both sides allowed.
///
/// The returned node's span excludes the surrounding whitespace.
[[nodiscard]] auto scan_value(std::string_view text, size_t offset,
                              const ParseOptions& options = {}) -> Result<AstNode, JsonError>;

// ============================================================================
// Top-Level Driver
// ============================================================================

/// Parses a complete JSON document.
///
/// The document must be exactly one value, optionally surrounded by
/// whitespace. Anything else after the value fails with
/// `unexpected character at N`.
///
/// # Returns
///
/// `Ok(AstNode)` holding the root on success, `Err(JsonError)` on failure.
[[nodiscard]] auto parse_json(std::string_view text, const ParseOptions& options = {})
    -> Result<AstNode, JsonError>;

} // namespace jsonast::json
