//! # jsonast JSON Library
//!
//! Main public header. Parses JSON text into a syntax tree that records the
//! byte span of every node, converts trees to plain values and walks them.
//!
//! ## Quick Start
//!
//! ```cpp
//! #include "jsonast/json/json.hpp"
//! using namespace jsonast;
//! using namespace jsonast::json;
//!
//! auto result = parse_json(R"({"name": "Alice", "tags": ["a"]})");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//!     return;
//! }
//!
//! // Where does each value live in the source?
//! traverse(unwrap(result), [](const AstNodeRef& ref, const AstPath& path) {
//!     std::cout << to_json_pointer(path) << " [" << ref.start() << ", " << ref.end() << ")\n";
//!     return true;
//! });
//!
//! // Plain values
//! JsonValue value = ast_to_value(unwrap(result));
//! std::cout << value.get("name")->as_string() << std::endl;
//! ```
//!
//! ## Modules
//!
//! | Header | Description |
//! |--------|-------------|
//! | `json_error.hpp` | Error type with kind and line/column |
//! | `json_ast.hpp` | Syntax tree nodes with byte spans |
//! | `json_cursor.hpp` | UTF-8 cursor and character classes |
//! | `json_parser.hpp` | Recognizers, dispatcher and `parse_json` |
//! | `json_value.hpp` | Native values and `ast_to_value` |
//! | `json_traverse.hpp` | Pre-order traversal and JSON Pointers |

#pragma once

#include "jsonast/json/json_ast.hpp"
#include "jsonast/json/json_cursor.hpp"
#include "jsonast/json/json_error.hpp"
#include "jsonast/json/json_parser.hpp"
#include "jsonast/json/json_traverse.hpp"
#include "jsonast/json/json_value.hpp"
