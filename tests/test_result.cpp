#include <catch2/catch.hpp>
#include <ope/result.hpp>
#include <memory>
#include <string>

using namespace ope;

static Result<size_t> region_count(Result<std::string> source) {
    OPE_TRY(source);
    size_t n = 0;
    for (char c : source.value()) {
        if (c == '(') ++n;
    }
    return Result<size_t>::ok(n);
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 42);
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(OpeError{OpeError::UnbalancedDelimiters, "unbalanced"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == OpeError::UnbalancedDelimiters);
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("OPE_TRY propagates errors and passes through Ok", "[result]") {
    auto ok = region_count(Result<std::string>::ok("^(a)b(c)$"));
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 2);

    auto err = region_count(OpeError{OpeError::NotIndex, "bad index"});
    REQUIRE(err.is_err());
    REQUIRE(err.error().code == OpeError::NotIndex);
    REQUIRE(err.error().message == "bad index");
}

TEST_CASE("Status ok and err", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(OpeError{OpeError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == OpeError::Config);
}

static Result<int> owned_value(Result<std::unique_ptr<int>> r) {
    OPE_TRY(r);
    return Result<int>::ok(*r.value());
}

TEST_CASE("OPE_TRY works with move-only results", "[result]") {
    auto ok = owned_value(Result<std::unique_ptr<int>>::ok(std::make_unique<int>(3)));
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value() == 3);

    auto err = owned_value(OpeError{OpeError::Lock, "poisoned"});
    REQUIRE(err.is_err());
    REQUIRE(err.error().code == OpeError::Lock);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    auto owned = std::move(r).value();
    REQUIRE(*owned == 99);
}

TEST_CASE("OpeError format() with hint", "[error]") {
    OpeError e{OpeError::InvalidCacheSize, "invalid cache size 0", "use at least 1"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[InvalidCacheSize]") != std::string::npos);
    REQUIRE(formatted.find("invalid cache size 0") != std::string::npos);
    REQUIRE(formatted.find("hint: use at least 1") != std::string::npos);
}

TEST_CASE("OpeError format() without hint", "[error]") {
    OpeError e{OpeError::CompileRegex, "missing )"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[CompileRegex]: missing )");
}

TEST_CASE("OpeError code_name() for all codes", "[error]") {
    REQUIRE(std::string(OpeError::code_name(OpeError::InvalidCacheSize)) == "InvalidCacheSize");
    REQUIRE(std::string(OpeError::code_name(OpeError::UnbalancedDelimiters)) == "UnbalancedDelimiters");
    REQUIRE(std::string(OpeError::code_name(OpeError::CompileRegex)) == "CompileRegex");
    REQUIRE(std::string(OpeError::code_name(OpeError::Lock)) == "Lock");
    REQUIRE(std::string(OpeError::code_name(OpeError::NotIndex)) == "NotIndex");
    REQUIRE(std::string(OpeError::code_name(OpeError::Config)) == "Config");
    REQUIRE(std::string(OpeError::code_name(OpeError::IO)) == "IO");
    REQUIRE(std::string(OpeError::code_name(OpeError::InvalidArg)) == "InvalidArg");
}
