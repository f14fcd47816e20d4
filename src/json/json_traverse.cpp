#include "jsonast/json/json_traverse.hpp"

namespace jsonast::json {

namespace {

/// Visits `ref` and, unless the visitor declines, its children.
///
/// `path` is shared across the walk; each level pushes its segment before
/// descending and pops it afterwards.
void walk(const AstNodeRef& ref, AstPath& path, const AstVisitor& visitor) {
    if (!visitor(ref, path) || ref.is_property()) {
        return;
    }

    const AstNode& node = ref.node();
    if (node.is_object()) {
        for (const auto& property : node.as_object().properties) {
            path.push_back(AstPathSegment{&node, property.key_content()});
            // A property has no children of its own; its value is a sibling visit.
            visitor(AstNodeRef(property), path);
            walk(AstNodeRef(property.value), path, visitor);
            path.pop_back();
        }
    } else if (node.is_array()) {
        const auto& elements = node.as_array().elements;
        for (size_t i = 0; i < elements.size(); ++i) {
            path.push_back(AstPathSegment{&node, i});
            walk(AstNodeRef(elements[i]), path, visitor);
            path.pop_back();
        }
    }
}

} // namespace

void traverse(const AstNode& root, const AstVisitor& visitor) {
    AstPath path;
    walk(AstNodeRef(root), path, visitor);
}

void traverse(const AstProperty& property, const AstVisitor& visitor) {
    AstPath path;
    walk(AstNodeRef(property), path, visitor);
}

auto to_json_pointer(const AstPath& path) -> std::string {
    std::string pointer;
    for (const auto& segment : path) {
        pointer += '/';
        if (segment.is_index()) {
            pointer += std::to_string(segment.index());
            continue;
        }
        for (char c : segment.name()) {
            if (c == '~') {
                pointer += "~0";
            } else if (c == '/') {
                pointer += "~1";
            } else {
                pointer += c;
            }
        }
    }
    return pointer;
}

} // namespace jsonast::json
