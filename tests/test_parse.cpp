#include <catch2/catch.hpp>
#include <uuidkit/uuid.hpp>

using namespace uuidkit;

static const std::string kExpected =
    std::string("\x12\x3e\x45\x67\xe8\x9b\x12\xd3\xa4\x56\x42\x66\x55\x44\x00\x00", 16);

// ===== Accepted layouts =====

TEST_CASE("Parse accepted layouts", "[parse]") {
    auto input = GENERATE(
        std::string("123e4567e89b12d3a456426655440000"),
        std::string("123e4567-e89b-12d3-a456-426655440000"),
        std::string("urn:uuid:123e4567-e89b-12d3-a456-426655440000"),
        std::string("urn:uuid:123e4567e89b12d3a456426655440000"),
        std::string("{123e4567-e89b-12d3-a456-426655440000}"),
        std::string("{123e4567e89b12d3a456426655440000}"),
        std::string("123E4567E89B12D3A456426655440000"),
        std::string(" \t{\t{ { \t123e4567e89b12d3a456426655440000"),
        std::string("123e4567e89b12d3a456426655440000 \t}\t} } \t"),
        std::string("----123e-4567-e89b-12d3-a456-4266-5544-0000----"),
        std::string(" \t ---- { urn:uuid:----123e-4567-e89b-12d3-a456-4266-5544-0000---- } ---- \t "));

    INFO("input: " << input);
    auto r = Uuid::parse(input);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_binary() == kExpected);
    REQUIRE(r.value().to_string() == "123e4567-e89b-12d3-a456-426655440000");
}

TEST_CASE("Parse keeps any variant and version", "[parse]") {
    auto r = Uuid::parse("ffffffff-ffff-ffff-ffff-ffffffffffff");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().version() == 15);
    REQUIRE(r.value().variant() == Uuid::VariantFutureReserved);

    auto ms = Uuid::parse("{00000000-0000-0000-c000-000000000000}");
    REQUIRE(ms.is_ok());
    REQUIRE(ms.value().variant() == Uuid::VariantMicrosoft);
}

TEST_CASE("Parse round-trips the formatter output", "[parse]") {
    for (const auto& u : {Uuid::nil(), Uuid::namespace_dns(), Uuid::namespace_x500(),
                          Uuid::v5(Uuid::namespace_url(), "https://example.org/")}) {
        REQUIRE(Uuid::parse(u.to_string()).value() == u);
        REQUIRE(Uuid::parse(u.to_hex()).value() == u);
    }
}

// ===== Insufficient length =====

TEST_CASE("Parse rejects short input before decoding", "[parse]") {
    auto input = GENERATE(
        std::string(""),
        std::string("0"),
        std::string("0000000000000000000000000000000"),
        std::string(" \t{012345678901234567890123456789}\t "),
        std::string("urn:uuid:"),
        std::string("{}"));

    INFO("input: " << input);
    auto r = Uuid::parse(input);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InsufficientLength);
    REQUIRE(r.error().input == input);
    REQUIRE(r.error().position == 0);
}

TEST_CASE("Parse reports the remaining character count", "[parse]") {
    auto r = Uuid::parse(" \t{012345678901234567890123456789}\t ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "Expected at least 32 hexadecimal digits, but got 30");
    REQUIRE(r.error().length == 30);
}

TEST_CASE("Parse rejects three non-hex characters as too short", "[parse]") {
    auto r = Uuid::parse("xyz");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InsufficientLength);
    REQUIRE(r.error().message == "Expected at least 32 hexadecimal digits, but got 3");
}

TEST_CASE("Parse counts digits once interior hyphens are dropped", "[parse]") {
    // 32 characters, but only 30 of them are digits
    auto r = Uuid::parse("0123456789-0123456789-0123456789");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InsufficientLength);
    REQUIRE(r.error().message == "Expected at least 32 hexadecimal digits, but got 30");
    REQUIRE(r.error().position == 14);
}

TEST_CASE("Odd digit counts are measured in digits", "[parse]") {
    // 31 digits cannot be decoded into bytes; 31 > 16 makes it excessive
    auto r = Uuid::parse("0123456789abcdef-0123456789abcde");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::ExcessiveLength);
    REQUIRE(r.error().length == 31);
    REQUIRE(r.error().position == 30);

    auto canonical = Uuid::parse("12345678-1234-1234-1234-123456789ab");
    REQUIRE(canonical.is_err());
    REQUIRE(canonical.error().code == UuidError::ExcessiveLength);
    REQUIRE(canonical.error().position == 30);
}

TEST_CASE("Few odd digits padded with hyphens are too short", "[parse]") {
    // 15 digits spread over 43 characters
    auto r = Uuid::parse("0--1--2--3--4--5--6--7--8--9--a--b--c--d--e");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InsufficientLength);
    REQUIRE(r.error().length == 15);
    REQUIRE(r.error().position == 14);
}

TEST_CASE("URN prefix must touch the digits", "[parse]") {
    // A blank between scheme and digits is not stripped and is not hex
    auto r = Uuid::parse("urn:uuid: 123e4567-e89b-12d3-a456-426655440000");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InvalidHexDigit);
    REQUIRE(r.error().position == 0);

    auto braced = Uuid::parse("urn:uuid:{123e4567-e89b-12d3-a456-426655440000}");
    REQUIRE(braced.is_err());
    REQUIRE(braced.error().code == UuidError::InvalidHexDigit);
}

TEST_CASE("URN prefix is removed only once", "[parse]") {
    auto r = Uuid::parse("urn:uuid:urn:uuid:123e4567e89b12d3a456426655440000");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InvalidHexDigit);
    REQUIRE(r.error().message == "Expected hexadecimal digit, but found 'u' (0x75)");
}

// ===== Invalid hex digit =====

TEST_CASE("Parse reports the first invalid hex digit", "[parse]") {
    const std::string input = "01234567-89ab-cdef-0123-456789abcPHP";
    auto r = Uuid::parse(input);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InvalidHexDigit);
    REQUIRE(r.error().message == "Expected hexadecimal digit, but found 'P' (0x50)");
    REQUIRE(r.error().input == input);
    REQUIRE(r.error().position == 33);
}

TEST_CASE("Invalid digit offset is relative to the trimmed text", "[parse]") {
    const std::string input = "  {01234567-89ab-cdef-0123-g56789abcdef}";
    auto r = Uuid::parse(input);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InvalidHexDigit);
    REQUIRE(r.error().message == "Expected hexadecimal digit, but found 'g' (0x67)");
    REQUIRE(r.error().input == input);
    REQUIRE(r.error().position == 24);
}

TEST_CASE("Invalid digits win over length errors", "[parse]") {
    auto r = Uuid::parse("0123456789abcdef0123456789abcdef0123456789z");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InvalidHexDigit);
    REQUIRE(r.error().position == 42);
}

TEST_CASE("Interior blanks are invalid digits", "[parse]") {
    auto r = Uuid::parse("123e4567 e89b 12d3 a456 426655440000");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::InvalidHexDigit);
    REQUIRE(r.error().message == "Expected hexadecimal digit, but found ' ' (0x20)");
    REQUIRE(r.error().position == 8);
}

// ===== Excessive length =====

TEST_CASE("Parse rejects too many digits", "[parse]") {
    const std::string input = "12345678-1234-1234-1234-123456789abcdef";
    auto r = Uuid::parse(input);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::ExcessiveLength);
    REQUIRE(r.error().message == "Expected no more than 32 hexadecimal digits");
    REQUIRE(r.error().input == input);
    // 35 digits: the unpaired last digit stops byte decoding
    REQUIRE(r.error().position == 34);
}

TEST_CASE("Excess with an even digit count reports the last byte", "[parse]") {
    auto r = Uuid::parse("123e4567e89b12d3a45642665544000000");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UuidError::ExcessiveLength);
    REQUIRE(r.error().length == 34);
    REQUIRE(r.error().position == 16);
}

TEST_CASE("Parse failures are parse errors", "[parse]") {
    REQUIRE(Uuid::parse("").error().is_parse_error());
    REQUIRE(Uuid::parse("zzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz").error().is_parse_error());
    REQUIRE(Uuid::parse(std::string(40, 'a')).error().is_parse_error());
}
