/// @file test_conformance.cpp
/// @brief End-to-end properties of parse/format/beautify (safety net for perf changes).
///
/// Covers: round-trip in both modes, beautify idempotence, whitespace
/// insensitivity, duplicate keys, rejected syntax, error reporting through
/// the public entry points.

#include <lexjson/lexjson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace lexjson;

namespace {

const std::vector<std::string>& sample_documents() {
    static const std::vector<std::string> docs = {
        "null",
        "true",
        "-12.75",
        R"("plain")",
        R"("with \"quotes\" and \\ slash")",
        "[]",
        "{}",
        R"([1,[2,[3,[]]],{}])",
        R"({"name":"bob","age":28.5})",
        R"({"a":{"b":{"c":[true,false,null]}},"d":"e"})",
        R"([{"id":1,"tags":["x","y"]},{"id":2,"tags":[]}])",
    };
    return docs;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Round-trip
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceRoundTrip, CompactIsStable) {
    for (const auto& doc : sample_documents()) {
        const Value v = parse(doc);
        EXPECT_EQ(format(v), doc);
        EXPECT_EQ(parse(format(v)), v) << doc;
    }
}

TEST(ConformanceRoundTrip, PrettyParsesBackEqual) {
    for (const auto& doc : sample_documents()) {
        const Value v = parse(doc);
        EXPECT_EQ(parse(format(v, true)), v) << doc;
    }
}

TEST(ConformanceRoundTrip, BeautifyIsIdempotent) {
    for (const auto& doc : sample_documents()) {
        const std::string once = beautify(doc);
        EXPECT_EQ(beautify(once), once) << doc;
    }
}

TEST(ConformanceRoundTrip, NumbersNormalise) {
    EXPECT_EQ(format(parse("+5")), "5");
    EXPECT_EQ(format(parse("007")), "7");
    EXPECT_EQ(format(parse(".5")), "0.5");
    EXPECT_EQ(format(parse("-0.0")), "0");
    EXPECT_EQ(format(parse("1.10")), "1.1");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Literal scenarios
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceScenarios, BeautifyObject) {
    EXPECT_EQ(beautify(R"({ "name": "bob", "age": 28.5 })"),
              "{\"name\": \"bob\",\n\"age\": 28.5}");
}

TEST(ConformanceScenarios, CompactFormatOfParsedObject) {
    EXPECT_EQ(format(parse(R"({ "name": "bob", "age": 28.5 })")),
              R"({"name":"bob","age":28.5})");
}

TEST(ConformanceScenarios, BeautifyArray) {
    EXPECT_EQ(beautify("[1,2,\n3]"), "[1, 2, 3]");
}

TEST(ConformanceScenarios, BeautifyScalar) {
    EXPECT_EQ(beautify("  true  "), "true");
    EXPECT_EQ(beautify(""), "null");
}

TEST(ConformanceScenarios, NotValidThrows) {
    EXPECT_THROW((void)parse("not valid"), ParseError);
    EXPECT_THROW((void)beautify("not valid"), ParseError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Structural properties
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceStructure, WhitespaceInsensitive) {
    const Value tight = parse(R"({"a":[1,2,{"b":null}],"c":"d"})");
    const Value loose = parse("{\n\t\"a\" : [ 1 ,\n 2 , { \"b\" :\tnull } ] ,\n\n \"c\" : \"d\" }\n");
    EXPECT_EQ(tight, loose);
}

TEST(ConformanceStructure, DuplicateKeysKeepLast) {
    EXPECT_EQ(format(parse(R"({"a":1,"b":2,"a":3})")), R"({"a":3,"b":2})");
}

TEST(ConformanceStructure, EmptyContainersSurvive) {
    EXPECT_EQ(format(parse("[ ]")), "[]");
    EXPECT_EQ(format(parse("{ }"), true), "{}");
    EXPECT_EQ(format(parse(R"({"a":[],"b":{}})")), R"({"a":[],"b":{}})");
}

TEST(ConformanceStructure, StringContentUntouched) {
    const char* doc = "[\"tab\there\",\"unicode \xE2\x9C\x93\"]";
    EXPECT_EQ(format(parse(doc)), doc);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rejected syntax
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceRejects, TrailingCommas) {
    EXPECT_THROW((void)parse("[1,2,]"), ParseError);
    EXPECT_THROW((void)parse(R"({"a":1,})"), ParseError);
}

TEST(ConformanceRejects, ExtendedSyntax) {
    for (const char* doc : {"1e5", "[1E5]", "0x10", "NaN", "Infinity", "'single'",
                            "// comment\n1", "/* c */ 1", "[\"\\u0041\"]", "[\"a\\/b\"]",
                            "True", "NULL", "{\"a\"=1}"}) {
        EXPECT_FALSE(try_parse(doc)) << doc;
    }
}

TEST(ConformanceRejects, UnterminatedDocuments) {
    for (const char* doc : {"[", "{", "[1,", "{\"a\":", "\"open", "[\"a\"", "{\"a\":1"}) {
        EXPECT_FALSE(try_parse(doc)) << doc;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Error reporting
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ConformanceErrors, TryBeautifyReportsCode) {
    auto ok = try_beautify("[1,2]");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value, "[1, 2]");

    auto bad = try_beautify("[1 2]");
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.ec, errc::expected_comma);
    EXPECT_TRUE(bad.value.empty());
}

TEST(ConformanceErrors, LocationOnThirdLine) {
    try {
        (void)parse("{\n\"a\": 1,\n\"b\": tru}");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.location().line, 3u);
        EXPECT_EQ(e.location().column, 6u);
        EXPECT_EQ(e.code(), errc::invalid_token);
        EXPECT_NE(std::string(e.what()).find("\"b\": tru}\n     ^"), std::string::npos);
    }
}

TEST(ConformanceErrors, ErrorCodeCategory) {
    std::error_code ec = errc::unterminated_string;
    EXPECT_STREQ(ec.category().name(), "json");
    EXPECT_EQ(ec.message(), "unterminated string");
    EXPECT_EQ(make_error_code(errc::ok).message(), "success");
}
