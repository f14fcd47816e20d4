//! # JSON Parser Implementation
//!
//! Object and array recognizers, the value dispatcher and the top-level
//! driver.
//!
//! ## Control Flow
//!
//! `parse_json` runs `parse_value` once over the whole text. `parse_value`
//! selects a recognizer from the lookahead character; the object and array
//! recognizers call `parse_value` again for every nested value. After each
//! delegated production the caller's cursor is snapped to the end of the
//! returned node, so nested recognizers alone decide how much they consume.
//!
//! ## Depth
//!
//! With `ParseOptions::max_depth == 0` nesting is bounded only by the call
//! stack. A non-zero limit is checked before a container is entered.

#include "jsonast/json/json_parser.hpp"

#include "jsonast/log/log.hpp"

namespace jsonast::json {

namespace {

/// Parses one `"key": value` entry at the cursor.
///
/// On return the cursor sits after the value and its trailing whitespace.
auto scan_property(Cursor& cursor, const ParseOptions& options, size_t depth)
    -> Result<AstProperty, JsonError> {
    size_t begin = cursor.offset();

    auto key = scan_string(cursor.text(), begin);
    if (is_err(key)) {
        return std::move(unwrap_err(key));
    }
    cursor.snap_to(unwrap(key));
    cursor.skip_whitespace();

    if (auto err = cursor.expect(U':')) {
        return *err;
    }

    auto value = parse_value(cursor, options, depth + 1);
    if (is_err(value)) {
        return std::move(unwrap_err(value));
    }

    size_t end = unwrap(value).end;
    return AstProperty{std::move(unwrap(key)), std::move(unwrap(value)), begin, end};
}

/// Runs the recognizer selected by the lookahead at the cursor.
auto dispatch(const Cursor& cursor, const ParseOptions& options, size_t depth)
    -> Result<AstNode, JsonError> {
    std::string_view text = cursor.text();
    size_t at = cursor.offset();
    char32_t c = cursor.current();

    if (c == U'{' || c == U'[') {
        if (options.max_depth > 0 && depth >= options.max_depth) {
            return cursor.error(JsonErrorKind::DepthExceeded, "maximum nesting depth exceeded");
        }
        return c == U'{' ? scan_object(text, at, options, depth)
                         : scan_array(text, at, options, depth);
    }
    if (c == U'"') {
        return scan_string(text, at);
    }
    if (c == U'-' || is_digit(c)) {
        return scan_number(text, at);
    }
    if (c == U't' || c == U'f') {
        return scan_boolean(text, at);
    }
    if (c == U'n') {
        return scan_null(text, at);
    }
    return cursor.error(JsonErrorKind::InvalidValue, "invalid value");
}

} // namespace

// ============================================================================
// Object
// ============================================================================

auto scan_object(std::string_view text, size_t offset, const ParseOptions& options, size_t depth)
    -> Result<AstNode, JsonError> {
    Cursor cursor(text, offset);
    if (auto err = cursor.expect(U'{')) {
        return *err;
    }
    cursor.skip_whitespace();

    AstObject object;
    if (cursor.current() == U'"') {
        while (true) {
            auto property = scan_property(cursor, options, depth);
            if (is_err(property)) {
                return std::move(unwrap_err(property));
            }
            object.properties.push_back(std::move(unwrap(property)));

            if (cursor.current() == U'}') {
                break;
            }
            if (auto err = cursor.expect(U',')) {
                return *err;
            }
            // A key must follow; `}` here is a trailing comma and fails in scan_string
            cursor.skip_whitespace();
        }
    }

    if (auto err = cursor.expect(U'}')) {
        return *err;
    }
    return AstNode{cursor.start(), cursor.offset(), std::move(object)};
}

// ============================================================================
// Array
// ============================================================================

auto scan_array(std::string_view text, size_t offset, const ParseOptions& options, size_t depth)
    -> Result<AstNode, JsonError> {
    Cursor cursor(text, offset);
    if (auto err = cursor.expect(U'[')) {
        return *err;
    }
    cursor.skip_whitespace();

    AstArray array;
    if (can_start_value(cursor.current())) {
        while (true) {
            auto element = parse_value(cursor, options, depth + 1);
            if (is_err(element)) {
                return element;
            }
            array.elements.push_back(std::move(unwrap(element)));

            if (cursor.current() != U',') {
                break;
            }
            cursor.advance();
        }
    }

    if (auto err = cursor.expect(U']')) {
        return *err;
    }
    return AstNode{cursor.start(), cursor.offset(), std::move(array)};
}

// ============================================================================
// Value Dispatcher
// ============================================================================

auto parse_value(Cursor& cursor, const ParseOptions& options, size_t depth)
    -> Result<AstNode, JsonError> {
    cursor.skip_whitespace();

    auto result = dispatch(cursor, options, depth);
    if (is_err(result)) {
        return result;
    }

    cursor.snap_to(unwrap(result));
    cursor.skip_whitespace();
    return result;
}

auto scan_value(std::string_view text, size_t offset, const ParseOptions& options)
    -> Result<AstNode, JsonError> {
    Cursor cursor(text, offset);
    return parse_value(cursor, options, 0);
}

// ============================================================================
// Top-Level Driver
// ============================================================================

auto parse_json(std::string_view text, const ParseOptions& options)
    -> Result<AstNode, JsonError> {
    JSONAST_LOG_TRACE("json", "parsing document of " << text.size() << " bytes");

    Cursor cursor(text);
    auto result = parse_value(cursor, options, 0);
    if (is_err(result)) {
        JSONAST_LOG_DEBUG("json", "parse failed: " << unwrap_err(result).to_string());
        return result;
    }

    if (!cursor.at_end()) {
        JsonError error = cursor.error(JsonErrorKind::TrailingContent,
                                       "unexpected character at " + std::to_string(cursor.offset()));
        JSONAST_LOG_DEBUG("json", "parse failed: " << error.to_string());
        return error;
    }

    JSONAST_LOG_DEBUG("json", "parsed " << text.size() << " bytes, root "
                                        << kind_name(unwrap(result).kind()) << " ["
                                        << unwrap(result).start << ", " << unwrap(result).end
                                        << ")");
    return result;
}

} // namespace jsonast::json
