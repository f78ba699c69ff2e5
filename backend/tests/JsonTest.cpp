#include "utils/Json.hpp"

#include "TestUtils.hpp"

#include <string>

#include <doctest/doctest.h>

namespace
{

bool same(char const *lhs, char const *rhs)
{
    auto left = tp::json::Document::parse(lhs);
    auto right = tp::json::Document::parse(rhs);
    REQUIRE(left.is_valid());
    REQUIRE(right.is_valid());
    auto copy = tp::json::MutableDocument::copy_of(left.root());
    return tp::json::equals(copy.root(), right.root());
}

} // namespace

TEST_CASE("equals ignores object member order")
{
    CHECK(same(R"({"a": 1, "b": {"c": "x", "d": [1, 2]}})",
               R"({"b": {"d": [1, 2], "c": "x"}, "a": 1})"));
}

TEST_CASE("equals compares numbers by value")
{
    CHECK(same(R"({"n": 1})", R"({"n": 1.0})"));
    CHECK(same(R"({"n": 0.25})", R"({"n": 0.25})"));
    CHECK_FALSE(same(R"({"n": 1})", R"({"n": 2})"));
}

TEST_CASE("equals detects structural differences")
{
    CHECK_FALSE(same(R"({"a": 1})", R"({"a": 1, "b": 2})"));
    CHECK_FALSE(same(R"({"a": [1, 2]})", R"({"a": [2, 1]})"));
    CHECK_FALSE(same(R"({"a": "1"})", R"({"a": 1})"));
    CHECK_FALSE(same(R"({"a": null})", R"({"a": false})"));
}

TEST_CASE("pretty output is indented and ends with a newline")
{
    auto parsed = tp::json::Document::parse(R"({"a":{"b":true}})");
    auto doc = tp::json::MutableDocument::copy_of(parsed.root());
    auto text = doc.write_pretty();
    CHECK(text == "{\n    \"a\": {\n        \"b\": true\n    }\n}\n");
}

TEST_CASE("read_file accepts a byte order mark and reports errors")
{
    tp::tests::TempDir dir("json");
    auto const good = dir.path() / "bom.json";
    tp::tests::write_text(good, "\xEF\xBB\xBF{\"a\": 1}");
    auto parsed = tp::json::Document::read_file(good);
    REQUIRE(parsed.is_valid());
    CHECK(yyjson_get_int(yyjson_obj_get(parsed.root(), "a")) == 1);

    auto const bad = dir.path() / "bad.json";
    tp::tests::write_text(bad, "{\"a\": ");
    std::string error;
    CHECK_FALSE(tp::json::Document::read_file(bad, &error).is_valid());
    CHECK_FALSE(error.empty());

    error.clear();
    CHECK_FALSE(
        tp::json::Document::read_file(dir.path() / "missing.json", &error)
            .is_valid());
    CHECK_FALSE(error.empty());
}

TEST_CASE("parse_value falls back to a string")
{
    auto doc = tp::json::MutableDocument::empty_object();
    auto *number = tp::json::parse_value(doc.doc(), "42");
    CHECK(tp::json::kind_of(number) == tp::json::Kind::number);
    auto *flag = tp::json::parse_value(doc.doc(), "true");
    CHECK(tp::json::kind_of(flag) == tp::json::Kind::boolean);
    auto *text = tp::json::parse_value(doc.doc(), "MPH");
    REQUIRE(tp::json::kind_of(text) == tp::json::Kind::string);
    CHECK(std::string(yyjson_mut_get_str(text)) == "MPH");
}
