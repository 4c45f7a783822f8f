#include <catch2/catch.hpp>
#include <ope/template_compiler.hpp>

using namespace ope;

static const Delimiters angle{'<', '>'};

static bool full(const std::string& tpl, const std::string& needle) {
    auto p = compile_template(tpl, angle);
    REQUIRE(p.is_ok());
    return pattern_matches(p.value(), needle);
}

// ---- build_pattern ----

TEST_CASE("build_pattern single region", "[compiler]") {
    auto r = build_pattern("<create|delete>", angle);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "^(create|delete)$");
}

TEST_CASE("build_pattern multiple regions", "[compiler]") {
    auto r = build_pattern("foo<a|b>bar<c|d>baz", angle);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "^foo(a|b)bar(c|d)baz$");
}

TEST_CASE("build_pattern quotes literal text", "[compiler]") {
    auto r = build_pattern("a.b<x|y>*+", angle);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "^a\\.b(x|y)\\*\\+$");
}

TEST_CASE("build_pattern keeps nested delimiters in region", "[compiler]") {
    auto r = build_pattern("<a<b>c>", angle);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "^(a<b>c)$");
}

TEST_CASE("build_pattern with brace delimiters", "[compiler]") {
    auto r = build_pattern("id{[0-9]{2}}", Delimiters{'{', '}'});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "^id([0-9]{2})$");
}

TEST_CASE("build_pattern empty region", "[compiler]") {
    auto r = build_pattern("a<>b", angle);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "^a()b$");
}

TEST_CASE("build_pattern unbalanced", "[compiler]") {
    auto missing_close = build_pattern("<abc", angle);
    REQUIRE(missing_close.is_err());
    REQUIRE(missing_close.error().code == OpeError::UnbalancedDelimiters);

    auto missing_open = build_pattern("abc>", angle);
    REQUIRE(missing_open.is_err());
    REQUIRE(missing_open.error().code == OpeError::UnbalancedDelimiters);
}

TEST_CASE("build_pattern rejects invalid region", "[compiler]") {
    auto r = build_pattern("ok<a(b>", angle);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == OpeError::CompileRegex);
}

TEST_CASE("build_pattern region cannot escape its group", "[compiler]") {
    auto r = build_pattern("<a)|(b>", angle);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == OpeError::CompileRegex);
}

TEST_CASE("build_pattern validates regions in order", "[compiler]") {
    // The first bad region is reported, not a later one.
    auto r = build_pattern("<[z-a]>x<(>", angle);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("[z-a]") != std::string::npos);
}

// ---- compile_template / pattern_matches ----

TEST_CASE("compiled template matches alternatives", "[compiler]") {
    REQUIRE(full("<create|delete>", "create"));
    REQUIRE(full("<create|delete>", "delete"));
    REQUIRE_FALSE(full("<create|delete>", "update"));
}

TEST_CASE("compiled template is anchored", "[compiler]") {
    REQUIRE_FALSE(full("<create|delete>", "xcreate"));
    REQUIRE_FALSE(full("<create|delete>", "created"));
    REQUIRE_FALSE(full("<create|delete>", "create\n"));
    REQUIRE_FALSE(full("<a|b>", "ab"));
}

TEST_CASE("compiled template literal text is literal", "[compiler]") {
    REQUIRE(full("a.b<c>", "a.bc"));
    REQUIRE_FALSE(full("a.b<c>", "axbc"));
    REQUIRE(full("res(1)/<.*>", "res(1)/anything"));
}

TEST_CASE("compiled template with resource path", "[compiler]") {
    REQUIRE(full("user/<[0-9]+>/profile", "user/42/profile"));
    REQUIRE_FALSE(full("user/<[0-9]+>/profile", "user/abc/profile"));
    REQUIRE_FALSE(full("user/<[0-9]+>/profile", "user/42/profile/x"));
}

TEST_CASE("compile_regex reports engine error", "[compiler]") {
    auto r = compile_regex("^(a$");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == OpeError::CompileRegex);
    REQUIRE(r.error().message.find("^(a$") != std::string::npos);
}
