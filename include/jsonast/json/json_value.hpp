//! # JSON Values
//!
//! Native value types produced from a syntax tree by `ast_to_value`, with
//! all source positions dropped.
//!
//! ## Type Mapping
//!
//! | Syntax node | C++ storage | Query | Accessor |
//! |-------------|-------------|-------|----------|
//! | `Null` | `std::monostate` | `is_null()` | - |
//! | `Boolean` | `bool` | `is_bool()` | `as_bool()` |
//! | `Number` | `double` | `is_number()` | `as_number()` |
//! | `String` | `std::string` | `is_string()` | `as_string()` |
//! | `Array` | `Box<JsonArray>` | `is_array()` | `as_array()`, `operator[]` |
//! | `Object` | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
//!
//! ## Objects
//!
//! `JsonObject` keeps keys in insertion order. Assigning an existing key
//! replaces its value in place, so converting `{"a":1,"b":2,"a":3}` gives
//! `{"a":3,"b":2}`.
//!
//! ## Example
//!
//! ```cpp
//! auto parsed = parse_json(R"({"port": 8080, "hosts": ["a", "b"]})");
//! JsonValue config = ast_to_value(unwrap(parsed));
//! if (auto* port = config.get("port")) {
//!     double p = port->as_number();
//! }
//! ```

#pragma once

#include "jsonast/common.hpp"
#include "jsonast/json/json_ast.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace jsonast::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

// ============================================================================
// JsonObject
// ============================================================================

/// A JSON object: key/value pairs in insertion order with keyed lookup.
class JsonObject {
public:
    using Entry = std::pair<std::string, JsonValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    /// Sets `key` to `value`.
    ///
    /// An existing key keeps its position and gets the new value; a new key
    /// is appended.
    void insert_or_assign(std::string key, JsonValue value);

    /// Returns the value for `key`, or `nullptr` if absent.
    [[nodiscard]] auto find(const std::string& key) const -> const JsonValue*;

    [[nodiscard]] auto contains(const std::string& key) const -> bool;
    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto empty() const -> bool;

    [[nodiscard]] auto begin() const -> const_iterator;
    [[nodiscard]] auto end() const -> const_iterator;

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// ============================================================================
// JsonValue
// ============================================================================

/// JSON value variant type representing any JSON value.
///
/// Arrays and objects are boxed to allow recursive structures, which makes
/// `JsonValue` move-only. Use `clone()` for deep copies.
struct JsonValue {
    /// The null type (empty state).
    using Null = std::monostate;

    /// The variant type holding all possible JSON values.
    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      double,           // number
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    /// The underlying variant storage.
    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Default constructor creates a `null` value.
    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(static_cast<double>(value)) {}
    explicit JsonValue(double value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value);
    explicit JsonValue(JsonObject value);

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Type Accessors
    // ========================================================================

    /// Gets the boolean value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a boolean.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    /// Gets the number value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a number.
    [[nodiscard]] auto as_number() const -> double {
        return std::get<double>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Container Access
    // ========================================================================

    /// Gets a value from an object by key.
    ///
    /// Returns `nullptr` if this is not an object or the key does not exist.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Gets an array element by index.
    ///
    /// # Panics
    ///
    /// Throws if this is not an array or index is out of bounds.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue&;

    /// Gets the size of an array or object; `0` for other types.
    [[nodiscard]] auto size() const -> size_t;

    // ========================================================================
    // Cloning and Comparison
    // ========================================================================

    /// Creates a deep copy of this value.
    [[nodiscard]] auto clone() const -> JsonValue;

    /// Structural equality.
    ///
    /// Values of different types are never equal. Arrays compare in order;
    /// objects compare by key regardless of key order.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_number(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

/// Creates an empty JSON array.
inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

/// Creates an empty JSON object.
inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

// ============================================================================
// AST Conversion
// ============================================================================

/// Rebuilds the lexical text of a number: `[-]integer[.fraction][e[-]exponent]`.
///
/// A `+` exponent sign from the source is not kept.
[[nodiscard]] auto number_text(const AstNumber& number) -> std::string;

/// Converts a syntax tree into native values.
///
/// Numbers are converted from `number_text` with `strtod`, so values beyond
/// the range of `double` become infinity or zero. Duplicate object keys
/// resolve to the last occurrence.
[[nodiscard]] auto ast_to_value(const AstNode& node) -> JsonValue;

} // namespace jsonast::json
