#include <catch2/catch.hpp>
#include <uuidkit/result.hpp>
#include <uuidkit/uuid.hpp>
#include <string>

using namespace uuidkit;

// Parses a namespace and derives a v5 UUID from it, bailing out early on
// the first failure.
static Result<Uuid> derive(const std::string& ns_text, const std::string& name) {
    UUIDKIT_TRY_ASSIGN(Uuid ns, Uuid::parse(ns_text));
    return Result<Uuid>::ok(Uuid::v5(ns, name));
}

static Status check_nil(const std::string& text) {
    auto parsed = Uuid::parse(text);
    UUIDKIT_TRY(parsed);
    if (!parsed.value().is_nil()) {
        return UuidError(UuidError::InvalidArg, "not nil");
    }
    return ok_status();
}

TEST_CASE("Ok result holds a value", "[result]") {
    auto r = Result<Uuid>::ok(Uuid::namespace_dns());
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == Uuid::namespace_dns());
}

TEST_CASE("Err result holds an error", "[result]") {
    Result<Uuid> r = UuidError(UuidError::Entropy, "no entropy");
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == UuidError::Entropy);
    REQUIRE(r.error().message == "no entropy");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Uuid::parse("");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("Error access on Ok throws bad_variant_access", "[result]") {
    auto r = Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    REQUIRE_THROWS_AS(r.error(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    REQUIRE(Uuid::parse("not a uuid").value_or(Uuid::nil()).is_nil());
    REQUIRE(Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8").value_or(Uuid::nil())
            == Uuid::namespace_dns());
}

TEST_CASE("map() transforms Ok value", "[result]") {
    auto r = Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    auto mapped = r.map([](Uuid& u) { return u.to_hex(); });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == "6ba7b8109dad11d180b400c04fd430c8");
}

TEST_CASE("map() passes through Err", "[result]") {
    auto r = Uuid::parse("{}");
    bool called = false;
    auto mapped = r.map([&](Uuid& u) { called = true; return u.version(); });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().code == UuidError::InsufficientLength);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto ok = Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8")
        .and_then([](Uuid& ns) { return Result<Uuid>::ok(Uuid::v5(ns, "php.net")); });
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().to_string() == "c4a760a8-dbcf-5254-a0d9-6a4474bd1b62");

    bool called = false;
    auto err = Uuid::parse("xyz").and_then([&](Uuid& ns) {
        called = true;
        return Result<Uuid>::ok(ns);
    });
    REQUIRE(err.is_err());
    REQUIRE_FALSE(called);
}

TEST_CASE("or_else() recovers from Err only", "[result]") {
    auto recovered = Uuid::parse("xyz").or_else([](UuidError&) {
        return Result<Uuid>::ok(Uuid::nil());
    });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value().is_nil());

    bool called = false;
    auto kept = Result<Uuid>::ok(Uuid::namespace_url()).or_else([&](UuidError&) {
        called = true;
        return Result<Uuid>::ok(Uuid::nil());
    });
    REQUIRE(kept.value() == Uuid::namespace_url());
    REQUIRE_FALSE(called);
}

TEST_CASE("UUIDKIT_TRY_ASSIGN binds or propagates", "[result]") {
    auto ok = derive("6ba7b810-9dad-11d1-80b4-00c04fd430c8", "php.net");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().to_string() == "c4a760a8-dbcf-5254-a0d9-6a4474bd1b62");

    auto err = derive("6ba7b810-9dad-11d1-80b4-00c04fd430cX", "php.net");
    REQUIRE(err.is_err());
    REQUIRE(err.error().code == UuidError::InvalidHexDigit);
    REQUIRE(err.error().position == 35);
}

TEST_CASE("UUIDKIT_TRY propagates across result types", "[result]") {
    REQUIRE(check_nil("00000000-0000-0000-0000-000000000000").is_ok());
    REQUIRE(check_nil("6ba7b810-9dad-11d1-80b4-00c04fd430c8").error().code == UuidError::InvalidArg);
    REQUIRE(check_nil("123").error().code == UuidError::InsufficientLength);
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(UuidError{UuidError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == UuidError::Config);
}
