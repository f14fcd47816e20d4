//! # Syntax Tree Traversal
//!
//! Depth-first, pre-order walk over a syntax tree with the path from the
//! starting node to each visited node.
//!
//! ## Visit Order
//!
//! The visitor sees a node before any of its children. Returning `false`
//! skips the children of that node; siblings are still visited. A property
//! and its value are siblings, so `false` for a property does not hide the
//! value.
//!
//! | Node | Children visited |
//! |------|------------------|
//! | `Object` | For each property: the property, then its value |
//! | `Array` | Each element |
//! | `Property` (as start node) | None |
//! | Scalars | None |
//!
//! ## Paths
//!
//! A path lists one segment per level below the starting node. A property
//! and its value share the segment `{object, key}`; an array element gets
//! `{array, index}`.
//!
//! ## Example
//!
//! ```cpp
//! auto root = unwrap(parse_json(R"({"a": [1, 2]})"));
//! traverse(root, [](const AstNodeRef& ref, const AstPath& path) {
//!     std::cout << to_json_pointer(path) << " " << kind_name(ref.kind()) << "\n";
//!     return true;
//! });
//! // (empty) object
//! // /a property
//! // /a array
//! // /a/0 number
//! // /a/1 number
//! ```

#pragma once

#include "jsonast/json/json_ast.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace jsonast::json {

/// A key within a parent: a property name or an element index.
using AstPathKey = std::variant<std::string, size_t>;

/// One step of a path: the container and the key used inside it.
struct AstPathSegment {
    /// The object or array that holds the next node.
    const AstNode* owner = nullptr;

    AstPathKey key;

    [[nodiscard]] auto is_index() const -> bool { return std::holds_alternative<size_t>(key); }
    [[nodiscard]] auto index() const -> size_t { return std::get<size_t>(key); }
    [[nodiscard]] auto name() const -> const std::string& { return std::get<std::string>(key); }
};

/// Segments from the starting node down to the visited node.
using AstPath = std::vector<AstPathSegment>;

/// Called for each visited node. Returning `false` skips its children.
using AstVisitor = std::function<bool(const AstNodeRef&, const AstPath&)>;

/// Walks `root` and everything below it.
///
/// # Arguments
///
/// * `root` - The node to start from; visited with an empty path
/// * `visitor` - Callback invoked once per visited node
void traverse(const AstNode& root, const AstVisitor& visitor);

/// Visits `property` alone with an empty path.
///
/// Its key and value are not descended into.
void traverse(const AstProperty& property, const AstVisitor& visitor);

/// Formats a path as an RFC 6901 JSON Pointer.
///
/// Returns `""` for the empty path. `~` and `/` in keys are written as `~0`
/// and `~1`.
[[nodiscard]] auto to_json_pointer(const AstPath& path) -> std::string;

} // namespace jsonast::json
