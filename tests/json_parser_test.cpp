//! # JSON Parser Tests
//!
//! ## Test Coverage
//!
//! - Scalar recognizers (strings, numbers, literals)
//! - Object and array recognizers
//! - Value dispatcher and top-level driver
//! - Node spans and error locations
//! - Optional nesting limit

#include "jsonast/common.hpp"
#include "jsonast/json/json_parser.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace jsonast;
using namespace jsonast::json;

namespace {

AstNode parse_ok(std::string_view text, const ParseOptions& options = {}) {
    auto result = parse_json(text, options);
    if (is_err(result)) {
        ADD_FAILURE() << "parse failed for `" << text << "`: " << unwrap_err(result).to_string();
        return AstNode{};
    }
    return std::move(unwrap(result));
}

JsonError parse_err(std::string_view text, const ParseOptions& options = {}) {
    auto result = parse_json(text, options);
    if (is_ok(result)) {
        ADD_FAILURE() << "parse unexpectedly succeeded for `" << text << "`";
        return JsonError{};
    }
    return unwrap_err(result);
}

/// Checks that every child span lies inside its parent's span.
void expect_nested_spans(const AstNode& node) {
    EXPECT_LE(node.start, node.end);
    if (node.is_object()) {
        for (const auto& property : node.as_object().properties) {
            EXPECT_LE(node.start, property.start);
            EXPECT_LE(property.end, node.end);
            EXPECT_EQ(property.start, property.key.start);
            EXPECT_EQ(property.end, property.value.end);
            EXPECT_LE(property.key.end, property.value.start);
            expect_nested_spans(property.value);
        }
    } else if (node.is_array()) {
        size_t previous_end = node.start;
        for (const auto& element : node.as_array().elements) {
            EXPECT_LE(previous_end, element.start);
            EXPECT_LE(element.end, node.end);
            previous_end = element.end;
            expect_nested_spans(element);
        }
    }
}

} // namespace

// ============================================================================
// String Recognizer
// ============================================================================

TEST(JsonStringTest, SimpleString) {
    auto result = scan_string(R"("abc")", 0);
    ASSERT_TRUE(is_ok(result));
    const auto& node = unwrap(result);
    EXPECT_EQ(node.kind(), AstKind::String);
    EXPECT_EQ(node.as_string().content, "abc");
    EXPECT_EQ(node.start, 0u);
    EXPECT_EQ(node.end, 5u);
}

TEST(JsonStringTest, StartsAtOffset) {
    auto result = scan_string(R"([ "x" ])", 2);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).start, 2u);
    EXPECT_EQ(unwrap(result).end, 5u);
}

TEST(JsonStringTest, EmptyString) {
    auto node = parse_ok(R"("")");
    EXPECT_EQ(node.as_string().content, "");
    EXPECT_EQ(node.length(), 2u);
}

TEST(JsonStringTest, SimpleEscapes) {
    auto node = parse_ok(R"("a\"b\\c\/d\b\f\n\r\t")");
    EXPECT_EQ(node.as_string().content, "a\"b\\c/d\b\f\n\r\t");
}

TEST(JsonStringTest, UnicodeEscapes) {
    EXPECT_EQ(parse_ok(R"("\u0061")").as_string().content, "a");
    EXPECT_EQ(parse_ok(R"("\u00e9")").as_string().content, "\xC3\xA9");
    EXPECT_EQ(parse_ok(R"("\u20AC")").as_string().content, "\xE2\x82\xAC");
}

TEST(JsonStringTest, SurrogateEscapesStayUnpaired) {
    auto node = parse_ok(R"("\uD83D\uDE00")");
    EXPECT_EQ(node.as_string().content, "\xED\xA0\xBD\xED\xB8\x80");
}

TEST(JsonStringTest, MultiByteContentKept) {
    auto node = parse_ok("\"h\xC3\xA9!\"");
    EXPECT_EQ(node.as_string().content, "h\xC3\xA9!");
    EXPECT_EQ(node.end, 6u);
}

TEST(JsonStringTest, RawControlCharactersAccepted) {
    auto node = parse_ok("\"a\tb\nc\"");
    EXPECT_EQ(node.as_string().content, "a\tb\nc");
}

TEST(JsonStringTest, InvalidEscapeCharacter) {
    auto err = parse_err(R"("\x")");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidEscape);
    EXPECT_EQ(err.message, "invalid escape character: x");
    EXPECT_EQ(err.offset, 2u);
}

TEST(JsonStringTest, InvalidUnicodeEscape) {
    auto err = parse_err(R"("\u12G4")");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidEscape);
    EXPECT_EQ(err.message, "invalid unicode escape: G");
    EXPECT_EQ(err.offset, 5u);
}

TEST(JsonStringTest, ShortUnicodeEscape) {
    auto err = parse_err(R"("\u12")");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidEscape);
    EXPECT_EQ(err.offset, 5u);
}

TEST(JsonStringTest, Unterminated) {
    auto err = parse_err(R"("abc)");
    EXPECT_EQ(err.kind, JsonErrorKind::UnterminatedString);
    EXPECT_EQ(err.message, "unterminated string");
    EXPECT_EQ(err.offset, 4u);
}

TEST(JsonStringTest, MissingOpeningQuote) {
    auto result = scan_string("abc", 0);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, JsonErrorKind::UnexpectedCharacter);
    EXPECT_EQ(unwrap_err(result).message, "expected \" but got a at 0");
}

// ============================================================================
// Number Recognizer
// ============================================================================

TEST(JsonNumberTest, Zero) {
    auto node = parse_ok("0");
    const auto& number = node.as_number();
    EXPECT_FALSE(number.negative);
    EXPECT_EQ(number.integer, "0");
    EXPECT_FALSE(number.has_fraction());
    EXPECT_FALSE(number.has_exponent());
}

TEST(JsonNumberTest, NegativeZero) {
    auto node = parse_ok("-0");
    EXPECT_TRUE(node.as_number().negative);
    EXPECT_EQ(node.as_number().integer, "0");
    EXPECT_EQ(node.end, 2u);
}

TEST(JsonNumberTest, Integer) {
    auto node = parse_ok("123");
    EXPECT_EQ(node.as_number().integer, "123");
    EXPECT_EQ(node.end, 3u);
}

TEST(JsonNumberTest, DecomposedParts) {
    auto node = parse_ok("-123.456e-7");
    const auto& number = node.as_number();
    EXPECT_TRUE(number.negative);
    EXPECT_EQ(number.integer, "123");
    EXPECT_EQ(number.fraction, "456");
    EXPECT_TRUE(number.exponent_negative);
    EXPECT_EQ(number.exponent, "7");
    EXPECT_EQ(node.start, 0u);
    EXPECT_EQ(node.end, 11u);
}

TEST(JsonNumberTest, UpperCaseExponentWithPlus) {
    auto node = parse_ok("1E+05");
    const auto& number = node.as_number();
    EXPECT_FALSE(number.exponent_negative);
    EXPECT_EQ(number.exponent, "05");
}

TEST(JsonNumberTest, LongDigitRunsKeptVerbatim) {
    auto node = parse_ok("123456789012345678901234567890.000000000000000000001");
    EXPECT_EQ(node.as_number().integer, "123456789012345678901234567890");
    EXPECT_EQ(node.as_number().fraction, "000000000000000000001");
}

TEST(JsonNumberTest, StopsAtNonDigit) {
    auto result = scan_number("12,", 0);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).end, 2u);
}

TEST(JsonNumberTest, LeadingZeroRejected) {
    auto err = parse_err("01");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidNumber);
    EXPECT_EQ(err.message, "invalid number");
    EXPECT_EQ(err.offset, 1u);

    EXPECT_EQ(parse_err("-01").kind, JsonErrorKind::InvalidNumber);
}

TEST(JsonNumberTest, BareMinusRejected) {
    auto err = parse_err("-");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidNumber);
    EXPECT_EQ(err.offset, 1u);
}

TEST(JsonNumberTest, DotsRejected) {
    EXPECT_EQ(parse_err(".").kind, JsonErrorKind::InvalidValue);
    EXPECT_EQ(parse_err(".5").kind, JsonErrorKind::InvalidValue);

    auto err = parse_err("1.");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidNumber);
    EXPECT_EQ(err.message, "invalid fractional parameter");
    EXPECT_EQ(err.offset, 2u);
}

TEST(JsonNumberTest, DanglingExponentRejected) {
    auto err = parse_err("1e");
    EXPECT_EQ(err.message, "invalid exponent parameter");
    EXPECT_EQ(err.offset, 2u);

    err = parse_err("1e-");
    EXPECT_EQ(err.message, "invalid exponent parameter");
    EXPECT_EQ(err.offset, 3u);

    EXPECT_EQ(parse_err("1E+").kind, JsonErrorKind::InvalidNumber);
}

TEST(JsonNumberTest, PlusSignRejected) {
    EXPECT_EQ(parse_err("+1").kind, JsonErrorKind::InvalidValue);
}

// ============================================================================
// Literal Recognizers
// ============================================================================

TEST(JsonLiteralTest, TrueFalseNull) {
    auto t = parse_ok("true");
    EXPECT_TRUE(t.as_boolean().value);
    EXPECT_EQ(t.end, 4u);

    auto f = parse_ok("false");
    EXPECT_FALSE(f.as_boolean().value);
    EXPECT_EQ(f.end, 5u);

    auto n = parse_ok("null");
    EXPECT_TRUE(n.is_null());
    EXPECT_EQ(n.end, 4u);
}

TEST(JsonLiteralTest, TruncatedLiteral) {
    auto err = parse_err("tru");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidLiteral);
    EXPECT_EQ(err.message, "expected e but got end of file at 3");

    EXPECT_EQ(parse_err("nul").kind, JsonErrorKind::InvalidLiteral);
}

TEST(JsonLiteralTest, MisspelledLiteral) {
    auto err = parse_err("fals3");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidLiteral);
    EXPECT_EQ(err.message, "expected e but got 3 at 4");
}

TEST(JsonLiteralTest, CaseSensitive) {
    EXPECT_EQ(parse_err("True").kind, JsonErrorKind::InvalidValue);
    EXPECT_EQ(parse_err("nULL").kind, JsonErrorKind::InvalidLiteral);
}

TEST(JsonLiteralTest, NoPrefixAcceptance) {
    auto err = parse_err("nulll");
    EXPECT_EQ(err.kind, JsonErrorKind::TrailingContent);
    EXPECT_EQ(err.offset, 4u);
}

TEST(JsonLiteralTest, BooleanRecognizerRejectsOtherInput) {
    auto result = scan_boolean("null", 0);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "invalid boolean");
}

// ============================================================================
// Object Recognizer
// ============================================================================

TEST(JsonObjectTest, Empty) {
    auto node = parse_ok("{}");
    EXPECT_TRUE(node.as_object().properties.empty());
    EXPECT_EQ(node.end, 2u);

    EXPECT_EQ(parse_ok("{ \n }").end, 5u);
}

TEST(JsonObjectTest, ScenarioStructure) {
    auto root = parse_ok(R"({"a":1,"b":[2,3]})");
    ASSERT_TRUE(root.is_object());
    EXPECT_EQ(root.start, 0u);
    EXPECT_EQ(root.end, 17u);

    const auto& props = root.as_object().properties;
    ASSERT_EQ(props.size(), 2u);

    EXPECT_EQ(props[0].key_content(), "a");
    EXPECT_EQ(props[0].value.as_number().integer, "1");
    EXPECT_EQ(props[0].start, 1u);
    EXPECT_EQ(props[0].end, 6u);
    EXPECT_EQ(props[0].key.start, 1u);
    EXPECT_EQ(props[0].key.end, 4u);
    EXPECT_EQ(props[0].value.start, 5u);
    EXPECT_EQ(props[0].value.end, 6u);

    EXPECT_EQ(props[1].key_content(), "b");
    EXPECT_EQ(props[1].start, 7u);
    EXPECT_EQ(props[1].end, 16u);
    const auto& elements = props[1].value.as_array().elements;
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(elements[0].as_number().integer, "2");
    EXPECT_EQ(elements[0].start, 12u);
    EXPECT_EQ(elements[1].as_number().integer, "3");
    EXPECT_EQ(elements[1].end, 15u);
}

TEST(JsonObjectTest, PropertySpanExcludesWhitespace) {
    auto root = parse_ok(R"( { "k" : "v" } )");
    EXPECT_EQ(root.start, 1u);
    EXPECT_EQ(root.end, 14u);

    const auto& prop = root.as_object().properties.at(0);
    EXPECT_EQ(prop.key.start, 3u);
    EXPECT_EQ(prop.key.end, 6u);
    EXPECT_EQ(prop.value.start, 9u);
    EXPECT_EQ(prop.value.end, 12u);
    EXPECT_EQ(prop.start, 3u);
    EXPECT_EQ(prop.end, 12u);
}

TEST(JsonObjectTest, NestedPropertySpan) {
    auto root = parse_ok(R"({"a": [1, 2]})");
    const auto& prop = root.as_object().properties.at(0);
    EXPECT_EQ(prop.start, 1u);
    EXPECT_EQ(prop.end, 12u);
    EXPECT_EQ(prop.value.start, 6u);
    EXPECT_EQ(root.end, 13u);
}

TEST(JsonObjectTest, DuplicateKeysPreserved) {
    auto root = parse_ok(R"({"a":1,"a":2})");
    const auto& props = root.as_object().properties;
    ASSERT_EQ(props.size(), 2u);
    EXPECT_EQ(props[0].value.as_number().integer, "1");
    EXPECT_EQ(props[1].value.as_number().integer, "2");
}

TEST(JsonObjectTest, EscapedKeysUnescaped) {
    auto root = parse_ok(R"({"a\/b\u0021":true})");
    EXPECT_EQ(root.as_object().properties.at(0).key_content(), "a/b!");
}

TEST(JsonObjectTest, TrailingCommaRejected) {
    auto err = parse_err(R"({"a":1,})");
    EXPECT_EQ(err.kind, JsonErrorKind::UnexpectedCharacter);
    EXPECT_EQ(err.message, "expected \" but got } at 7");
}

TEST(JsonObjectTest, MissingColon) {
    auto err = parse_err(R"({"a" 1})");
    EXPECT_EQ(err.message, "expected : but got 1 at 5");
}

TEST(JsonObjectTest, MissingComma) {
    auto err = parse_err(R"({"a":1 "b":2})");
    EXPECT_EQ(err.message, "expected , but got \" at 7");
}

TEST(JsonObjectTest, NonStringKey) {
    auto err = parse_err("{1:2}");
    EXPECT_EQ(err.message, "expected } but got 1 at 1");
}

TEST(JsonObjectTest, Unterminated) {
    auto err = parse_err(R"({"a":1)");
    EXPECT_EQ(err.kind, JsonErrorKind::UnexpectedCharacter);
    EXPECT_EQ(err.message, "expected , but got end of file at 6");
}

TEST(JsonObjectTest, MissingValue) {
    auto err = parse_err(R"({"a":})");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidValue);
    EXPECT_EQ(err.offset, 5u);
}

// ============================================================================
// Array Recognizer
// ============================================================================

TEST(JsonArrayTest, Empty) {
    EXPECT_TRUE(parse_ok("[]").as_array().elements.empty());
    EXPECT_EQ(parse_ok("[ ]").end, 3u);
}

TEST(JsonArrayTest, MixedElements) {
    auto root = parse_ok(R"([1, "two", true, null, {}, []])");
    const auto& elements = root.as_array().elements;
    ASSERT_EQ(elements.size(), 6u);
    EXPECT_EQ(elements[0].kind(), AstKind::Number);
    EXPECT_EQ(elements[1].kind(), AstKind::String);
    EXPECT_EQ(elements[2].kind(), AstKind::Boolean);
    EXPECT_EQ(elements[3].kind(), AstKind::Null);
    EXPECT_EQ(elements[4].kind(), AstKind::Object);
    EXPECT_EQ(elements[5].kind(), AstKind::Array);
}

TEST(JsonArrayTest, NestedSpans) {
    auto root = parse_ok("[[[]]]");
    const auto& middle = root.as_array().elements.at(0);
    const auto& inner = middle.as_array().elements.at(0);
    EXPECT_EQ(root.end, 6u);
    EXPECT_EQ(middle.start, 1u);
    EXPECT_EQ(middle.end, 5u);
    EXPECT_EQ(inner.start, 2u);
    EXPECT_EQ(inner.end, 4u);
}

TEST(JsonArrayTest, TrailingCommaRejected) {
    auto err = parse_err("[1,]");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidValue);
    EXPECT_EQ(err.message, "invalid value");
    EXPECT_EQ(err.offset, 3u);
    EXPECT_EQ(err.column, 4u);
}

TEST(JsonArrayTest, LeadingCommaRejected) {
    auto err = parse_err("[,1]");
    EXPECT_EQ(err.message, "expected ] but got , at 1");
}

TEST(JsonArrayTest, MissingComma) {
    auto err = parse_err("[1 2]");
    EXPECT_EQ(err.message, "expected ] but got 2 at 3");
}

TEST(JsonArrayTest, UnterminatedAfterComma) {
    auto err = parse_err("[1,2,");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidValue);
    EXPECT_EQ(err.offset, 5u);
}

TEST(JsonArrayTest, UnterminatedOpen) {
    auto err = parse_err("[");
    EXPECT_EQ(err.message, "expected ] but got end of file at 1");
}

// ============================================================================
// Dispatcher
// ============================================================================

TEST(JsonDispatchTest, ParseValueSkipsSurroundingWhitespace) {
    Cursor cursor(" 1 ,");
    auto result = parse_value(cursor);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).start, 1u);
    EXPECT_EQ(unwrap(result).end, 2u);
    EXPECT_EQ(cursor.offset(), 3u);
    EXPECT_EQ(cursor.current(), U',');
}

TEST(JsonDispatchTest, ScanValueAtOffset) {
    auto result = scan_value("xx [1] yy", 2);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).start, 3u);
    EXPECT_EQ(unwrap(result).end, 6u);
}

TEST(JsonDispatchTest, InvalidLookahead) {
    auto err = parse_err("@");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidValue);
    EXPECT_EQ(err.message, "invalid value");
}

TEST(JsonDispatchTest, RecognizersCalledDirectly) {
    auto obj = scan_object(R"(  {"a":[]})", 2);
    ASSERT_TRUE(is_ok(obj));
    EXPECT_EQ(unwrap(obj).start, 2u);
    EXPECT_EQ(unwrap(obj).end, 10u);

    auto arr = scan_array("[null]", 0);
    ASSERT_TRUE(is_ok(arr));
    EXPECT_TRUE(unwrap(arr).as_array().elements.at(0).is_null());

    auto null = scan_null("null", 0);
    ASSERT_TRUE(is_ok(null));
}

// ============================================================================
// Top-Level Driver
// ============================================================================

TEST(JsonDriverTest, WhitespaceAroundRoot) {
    auto root = parse_ok("  [1]  ");
    EXPECT_EQ(root.start, 2u);
    EXPECT_EQ(root.end, 5u);

    parse_ok("{\"a\":1} ");
    parse_ok("\xEF\xBB\xBF{}");
}

TEST(JsonDriverTest, TrailingContentRejected) {
    auto err = parse_err(R"({"a":1}x)");
    EXPECT_EQ(err.kind, JsonErrorKind::TrailingContent);
    EXPECT_EQ(err.message, "unexpected character at 7");

    err = parse_err("1 2");
    EXPECT_EQ(err.kind, JsonErrorKind::TrailingContent);
    EXPECT_EQ(err.offset, 2u);
}

TEST(JsonDriverTest, EmptyInputRejected) {
    EXPECT_EQ(parse_err("").kind, JsonErrorKind::InvalidValue);

    auto err = parse_err("   ");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidValue);
    EXPECT_EQ(err.offset, 3u);
}

TEST(JsonDriverTest, ScalarRoots) {
    EXPECT_EQ(parse_ok("\"\\u0061\"").as_string().content, "a");
    EXPECT_EQ(parse_ok(" 42 ").as_number().integer, "42");
    EXPECT_TRUE(parse_ok("null").is_null());
}

TEST(JsonDriverTest, ErrorLineAndColumn) {
    auto err = parse_err("{\n  \"a\": tru\n}");
    EXPECT_EQ(err.kind, JsonErrorKind::InvalidLiteral);
    EXPECT_EQ(err.offset, 12u);
    EXPECT_EQ(err.line, 2u);
    EXPECT_EQ(err.column, 11u);
}

TEST(JsonDriverTest, ChildSpansNested) {
    auto root = parse_ok(R"(
        {
            "name": "jsonast",
            "tags": ["parser", "ast", {"deep": [1.5e3, -0, false]}],
            "empty": {},
            "none": null
        }
    )");
    expect_nested_spans(root);
}

TEST(JsonDriverTest, SpanCoversSourceText) {
    std::string_view text = R"([ "x" , {"k":[true]} ])";
    auto root = parse_ok(text);
    const auto& elements = root.as_array().elements;
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(text.substr(elements[0].start, elements[0].length()), "\"x\"");
    EXPECT_EQ(text.substr(elements[1].start, elements[1].length()), R"({"k":[true]})");
}

// ============================================================================
// Nesting Limit
// ============================================================================

TEST(JsonDepthTest, UnlimitedByDefault) {
    std::string text(500, '[');
    text += std::string(500, ']');
    auto root = parse_ok(text);
    EXPECT_EQ(root.end, 1000u);
}

TEST(JsonDepthTest, LimitAllowsShallowInput) {
    ParseOptions options;
    options.max_depth = 1;
    parse_ok("[1]", options);
    parse_ok("{\"a\":1}", options);
}

TEST(JsonDepthTest, LimitRejectsDeeperInput) {
    ParseOptions options;
    options.max_depth = 1;
    auto err = parse_err("[[1]]", options);
    EXPECT_EQ(err.kind, JsonErrorKind::DepthExceeded);
    EXPECT_EQ(err.message, "maximum nesting depth exceeded");
    EXPECT_EQ(err.offset, 1u);

    options.max_depth = 2;
    err = parse_err(R"({"a":[{}]})", options);
    EXPECT_EQ(err.kind, JsonErrorKind::DepthExceeded);
    EXPECT_EQ(err.offset, 6u);
}

// ============================================================================
// Node Helpers
// ============================================================================

TEST(JsonAstTest, KindNames) {
    EXPECT_STREQ(kind_name(AstKind::Object), "object");
    EXPECT_STREQ(kind_name(AstKind::Number), "number");
    EXPECT_STREQ(kind_name(AstKind::Property), "property");
}

TEST(JsonAstTest, NodeRefOverPropertyAndNode) {
    auto root = parse_ok(R"({"a":true})");
    const auto& prop = root.as_object().properties.at(0);

    AstNodeRef prop_ref(prop);
    EXPECT_TRUE(prop_ref.is_property());
    EXPECT_EQ(prop_ref.kind(), AstKind::Property);
    EXPECT_EQ(prop_ref.start(), 1u);
    EXPECT_EQ(prop_ref.end(), 9u);

    AstNodeRef node_ref(prop.value);
    EXPECT_FALSE(node_ref.is_property());
    EXPECT_EQ(node_ref.kind(), AstKind::Boolean);
    EXPECT_EQ(&node_ref.node(), &prop.value);
}
