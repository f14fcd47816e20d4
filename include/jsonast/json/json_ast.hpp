//! # JSON Syntax Tree
//!
//! Position-annotated syntax tree produced by the parser. Every node records
//! the half-open byte range `[start, end)` of its own production in the
//! source text, delimiters included and surrounding whitespace excluded.
//!
//! ## Node Kinds
//!
//! | Kind | Payload | Notes |
//! |------|---------|-------|
//! | `Object` | `AstObject` | Properties in source order, duplicates kept |
//! | `Array` | `AstArray` | Elements in source order |
//! | `String` | `AstString` | Escapes already resolved |
//! | `Number` | `AstNumber` | Lexical parts, never a computed value |
//! | `Boolean` | `AstBoolean` | |
//! | `Null` | `AstNull` | |
//! | `Property` | `AstProperty` | Key/value pair of an object, not an `AstNode` |
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"a": [1, 2]})");
//! const AstNode& root = unwrap(result);
//! const AstProperty& prop = root.as_object().properties[0];
//! // prop.key_content() == "a", prop.start == 1, prop.end == 12
//! // prop.value.as_array().elements.size() == 2
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace jsonast::json {

// ============================================================================
// Node Kinds
// ============================================================================

/// Discriminator for syntax tree elements.
enum class AstKind : uint8_t {
    Object,
    Array,
    String,
    Number,
    Boolean,
    Null,
    Property
};

/// Returns the lower-case tag of a node kind (e.g., `"object"`).
[[nodiscard]] auto kind_name(AstKind kind) -> const char*;

struct AstNode;
struct AstProperty;

// ============================================================================
// Payloads
// ============================================================================

/// Object payload: properties in the order they appear in the source.
struct AstObject {
    std::vector<AstProperty> properties;
};

/// Array payload: elements in the order they appear in the source.
struct AstArray {
    std::vector<AstNode> elements;
};

/// String payload holding the unescaped UTF-8 content.
struct AstString {
    std::string content;
};

/// Number payload in decomposed lexical form.
///
/// `-12.50e+3` is stored as `negative = true`, `integer = "12"`,
/// `fraction = "50"`, `exponent_negative = false`, `exponent = "3"`.
/// Digit strings are kept verbatim so no precision is lost.
struct AstNumber {
    bool negative = false;
    std::string integer;
    std::string fraction;
    bool exponent_negative = false;
    std::string exponent;

    [[nodiscard]] auto has_fraction() const -> bool { return !fraction.empty(); }
    [[nodiscard]] auto has_exponent() const -> bool { return !exponent.empty(); }
};

/// Boolean payload.
struct AstBoolean {
    bool value = false;
};

/// Null payload.
struct AstNull {};

// ============================================================================
// AstNode
// ============================================================================

/// A value node of the syntax tree.
///
/// The payload variant order matches `AstKind`, so `kind()` is the variant
/// index. Nodes are built once by the parser and not modified afterwards.
struct AstNode {
    using Payload = std::variant<AstObject, AstArray, AstString, AstNumber, AstBoolean, AstNull>;

    /// Offset of the first byte of the production.
    size_t start = 0;

    /// Offset just past the last byte of the production.
    size_t end = 0;

    /// The typed payload.
    Payload data;

    [[nodiscard]] auto kind() const -> AstKind { return static_cast<AstKind>(data.index()); }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<AstObject>(data);
    }
    [[nodiscard]] auto is_array() const -> bool { return std::holds_alternative<AstArray>(data); }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<AstString>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<AstNumber>(data);
    }
    [[nodiscard]] auto is_boolean() const -> bool {
        return std::holds_alternative<AstBoolean>(data);
    }
    [[nodiscard]] auto is_null() const -> bool { return std::holds_alternative<AstNull>(data); }

    /// Returns the object payload.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    [[nodiscard]] auto as_object() const -> const AstObject& { return std::get<AstObject>(data); }
    [[nodiscard]] auto as_array() const -> const AstArray& { return std::get<AstArray>(data); }
    [[nodiscard]] auto as_string() const -> const AstString& { return std::get<AstString>(data); }
    [[nodiscard]] auto as_number() const -> const AstNumber& { return std::get<AstNumber>(data); }
    [[nodiscard]] auto as_boolean() const -> const AstBoolean& {
        return std::get<AstBoolean>(data);
    }

    /// Number of bytes covered by this node.
    [[nodiscard]] auto length() const -> size_t { return end - start; }
};

// ============================================================================
// AstProperty
// ============================================================================

/// One `"key": value` entry of an object.
///
/// The span runs from the opening quote of the key to the end of the value.
struct AstProperty {
    /// The key, always a `String` node.
    AstNode key;

    /// The value node.
    AstNode value;

    size_t start = 0;
    size_t end = 0;

    /// Returns the unescaped key text.
    [[nodiscard]] auto key_content() const -> const std::string& {
        return key.as_string().content;
    }
};

// ============================================================================
// AstNodeRef
// ============================================================================

/// Non-owning reference to either a value node or an object property.
///
/// Traversal hands these to visitors so that property wrappers and value
/// nodes can be reported through the same callback.
class AstNodeRef {
public:
    AstNodeRef(const AstNode& node) : node_(&node) {}
    AstNodeRef(const AstProperty& property) : property_(&property) {}

    [[nodiscard]] auto is_property() const -> bool { return property_ != nullptr; }

    /// Returns the referenced node. Must not be called on a property reference.
    [[nodiscard]] auto node() const -> const AstNode& { return *node_; }

    /// Returns the referenced property. Must not be called on a node reference.
    [[nodiscard]] auto property() const -> const AstProperty& { return *property_; }

    [[nodiscard]] auto kind() const -> AstKind {
        return property_ ? AstKind::Property : node_->kind();
    }
    [[nodiscard]] auto start() const -> size_t { return property_ ? property_->start : node_->start; }
    [[nodiscard]] auto end() const -> size_t { return property_ ? property_->end : node_->end; }

private:
    const AstNode* node_ = nullptr;
    const AstProperty* property_ = nullptr;
};

} // namespace jsonast::json
