//! # JSON Value Implementation
//!
//! Object storage, deep copies and structural equality for `JsonValue`,
//! plus the conversion from syntax trees.
//!
//! ## Equality Semantics
//!
//! | Type | Comparison Rule |
//! |------|-----------------|
//! | `null` | All nulls are equal |
//! | `bool` | Standard boolean comparison |
//! | `number` | `double` comparison |
//! | `string` | Byte-by-byte string comparison |
//! | `array` | Element-by-element in order |
//! | `object` | Key-value pair comparison (order independent) |
//!
//! ## Number Conversion
//!
//! The decomposed number is reassembled into its lexical form and handed to
//! `strtod`. No digits are lost before that point, so the result is the
//! closest `double` to the source text.

#include "jsonast/json/json_value.hpp"

#include <cstdlib>

namespace jsonast::json {

// ============================================================================
// JsonObject
// ============================================================================

void JsonObject::insert_or_assign(std::string key, JsonValue value) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
}

auto JsonObject::find(const std::string& key) const -> const JsonValue* {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

auto JsonObject::contains(const std::string& key) const -> bool {
    return index_.count(key) > 0;
}

auto JsonObject::size() const -> size_t {
    return entries_.size();
}

auto JsonObject::empty() const -> bool {
    return entries_.empty();
}

auto JsonObject::begin() const -> const_iterator {
    return entries_.begin();
}

auto JsonObject::end() const -> const_iterator {
    return entries_.end();
}

// ============================================================================
// JsonValue
// ============================================================================

JsonValue::JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}

JsonValue::JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->find(key);
    }
    return nullptr;
}

auto JsonValue::operator[](size_t index) const -> const JsonValue& {
    return as_array().at(index);
}

auto JsonValue::size() const -> size_t {
    if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
        return (*arr)->size();
    }
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    if (is_array()) {
        JsonArray copy;
        copy.reserve(as_array().size());
        for (const auto& item : as_array()) {
            copy.push_back(item.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_object()) {
        JsonObject copy;
        for (const auto& [key, val] : as_object()) {
            copy.insert_or_assign(key, val.clone());
        }
        return JsonValue(std::move(copy));
    }
    return JsonValue();
}

/// Compares two `JsonValue` instances for equality.
///
/// # Example
///
/// ```cpp
/// JsonObject first;
/// first.insert_or_assign("a", JsonValue(1));
/// first.insert_or_assign("b", JsonValue(2));
/// JsonObject second;
/// second.insert_or_assign("b", JsonValue(2));
/// second.insert_or_assign("a", JsonValue(1));
/// assert(JsonValue(std::move(first)) == JsonValue(std::move(second)));
/// ```
auto JsonValue::operator==(const JsonValue& other) const -> bool {
    // Different variant types are not equal
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }

    if (is_bool()) {
        return as_bool() == other.as_bool();
    }

    if (is_number()) {
        return as_number() == other.as_number();
    }

    if (is_string()) {
        return as_string() == other.as_string();
    }

    if (is_array()) {
        const auto& arr1 = as_array();
        const auto& arr2 = other.as_array();
        if (arr1.size() != arr2.size()) {
            return false;
        }
        for (size_t i = 0; i < arr1.size(); ++i) {
            if (arr1[i] != arr2[i]) {
                return false;
            }
        }
        return true;
    }

    if (is_object()) {
        const auto& obj1 = as_object();
        const auto& obj2 = other.as_object();
        if (obj1.size() != obj2.size()) {
            return false;
        }
        for (const auto& [key, val] : obj1) {
            const JsonValue* match = obj2.find(key);
            if (match == nullptr || *match != val) {
                return false;
            }
        }
        return true;
    }

    return false;
}

// ============================================================================
// AST Conversion
// ============================================================================

auto number_text(const AstNumber& number) -> std::string {
    std::string text;
    text.reserve(number.integer.size() + number.fraction.size() + number.exponent.size() + 4);
    if (number.negative) {
        text += '-';
    }
    text += number.integer;
    if (number.has_fraction()) {
        text += '.';
        text += number.fraction;
    }
    if (number.has_exponent()) {
        text += 'e';
        if (number.exponent_negative) {
            text += '-';
        }
        text += number.exponent;
    }
    return text;
}

auto ast_to_value(const AstNode& node) -> JsonValue {
    switch (node.kind()) {
    case AstKind::Object: {
        JsonObject object;
        for (const auto& property : node.as_object().properties) {
            object.insert_or_assign(property.key_content(), ast_to_value(property.value));
        }
        return JsonValue(std::move(object));
    }
    case AstKind::Array: {
        const auto& elements = node.as_array().elements;
        JsonArray array;
        array.reserve(elements.size());
        for (const auto& element : elements) {
            array.push_back(ast_to_value(element));
        }
        return JsonValue(std::move(array));
    }
    case AstKind::String:
        return JsonValue(node.as_string().content);
    case AstKind::Number: {
        std::string text = number_text(node.as_number());
        return JsonValue(std::strtod(text.c_str(), nullptr));
    }
    case AstKind::Boolean:
        return JsonValue(node.as_boolean().value);
    case AstKind::Null:
    case AstKind::Property:
        break;
    }
    return JsonValue();
}

} // namespace jsonast::json
