#include "jsonast/json/json_ast.hpp"

namespace jsonast::json {

auto kind_name(AstKind kind) -> const char* {
    switch (kind) {
    case AstKind::Object:
        return "object";
    case AstKind::Array:
        return "array";
    case AstKind::String:
        return "string";
    case AstKind::Number:
        return "number";
    case AstKind::Boolean:
        return "boolean";
    case AstKind::Null:
        return "null";
    case AstKind::Property:
        return "property";
    }
    return "unknown";
}

} // namespace jsonast::json
