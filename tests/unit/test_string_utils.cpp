#include <catch2/catch.hpp>

#include "utils/string_utils.hpp"

TEST_CASE("url_encode keeps only unreserved characters", "[string_utils]") {
    REQUIRE(string_utils::url_encode("abc-._~XYZ09") == "abc-._~XYZ09");
    REQUIRE(string_utils::url_encode("a b+c/d=e&f") == "a%20b%2Bc%2Fd%3De%26f");
    REQUIRE(string_utils::url_encode("\xC3\xA9") == "%C3%A9");
}

TEST_CASE("url_decode handles plus and malformed escapes", "[string_utils]") {
    REQUIRE(string_utils::url_decode("a+b%20c") == "a b c");
    REQUIRE(string_utils::url_decode("%41%4a") == "AJ");
    REQUIRE(string_utils::url_decode("100%") == "100%");
    REQUIRE(string_utils::url_decode("%zz") == "%zz");
}

TEST_CASE("parse_query and build_query", "[string_utils]") {
    const auto params = string_utils::parse_query("b=2&a=x%20y&&flag");

    REQUIRE(params == string_utils::KeyValues{{"b", "2"}, {"a", "x y"}, {"flag", ""}});
    REQUIRE(string_utils::build_query(params) == "b=2&a=x%20y&flag=");
    REQUIRE(string_utils::parse_query("").empty());
}

TEST_CASE("case-insensitive helpers", "[string_utils]") {
    REQUIRE(string_utils::iequals("Content-Type", "content-type"));
    REQUIRE_FALSE(string_utils::iequals("Content-Type", "content"));
    REQUIRE(string_utils::icontains("Application/JSON;charset=UTF-8", "json"));
    REQUIRE(string_utils::ieq_prefix("Multipart/Form-Data; boundary=x", 31, "multipart/form-data"));
    REQUIRE_FALSE(string_utils::ieq_prefix("multi", 5, "multipart/form-data"));
}

TEST_CASE("ieq_prefix accepts bytes outside ASCII", "[string_utils]") {
    const char line[] = "\xC3\xA9tag: value";

    REQUIRE_FALSE(string_utils::ieq_prefix(line, sizeof(line) - 1, "HTTP/"));
    REQUIRE(string_utils::ieq_prefix(line, sizeof(line) - 1, "\xC3\xA9TAG"));
    REQUIRE_FALSE(string_utils::ieq_prefix("\xFF\xFE", 2, "\xFF\xFD"));
}

TEST_CASE("trim and case conversion", "[string_utils]") {
    REQUIRE(string_utils::trim("  sandbox \n") == "sandbox");
    REQUIRE(string_utils::to_upper("get") == "GET");
    REQUIRE(string_utils::to_lower("PRODUCTION") == "production");
    REQUIRE(string_utils::ends_with("Classes", "es"));
    REQUIRE_FALSE(string_utils::starts_with("/path", "http://"));
}
