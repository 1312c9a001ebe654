#include <uuidkit/uuid.hpp>
#include <uuidkit/log.hpp>
#include <cstdio>

namespace uuidkit {

static const char kLeadingNoise[]  = " \t{-";
static const char kTrailingNoise[] = " \t}-";
static const std::string kUrnPrefix = "urn:uuid:";

static const size_t kHexDigits = 2 * Uuid::kSize;

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static UuidError parse_failure(UuidError e) {
    log::debug("cannot parse UUID \"%s\": %s (position %zu)",
               e.input.c_str(), e.message.c_str(), e.position);
    return e;
}

static UuidError insufficient(const std::string& input, size_t count, size_t position) {
    UuidError e = UuidError::parse(UuidError::InsufficientLength,
        "Expected at least 32 hexadecimal digits, but got " + std::to_string(count),
        input, position);
    e.length = count;
    return parse_failure(std::move(e));
}

// Strips the decoration, then walks the body once. Hyphens anywhere in the
// body are skipped; the first non-hex character aborts with its offset in
// the trimmed text.
Result<Uuid> Uuid::parse(const std::string& input) {
    size_t begin = input.find_first_not_of(kLeadingNoise);
    if (begin == std::string::npos) begin = input.size();

    // The scheme must be directly followed by the digits, so no second
    // round of stripping happens after it.
    if (input.compare(begin, kUrnPrefix.size(), kUrnPrefix) == 0) {
        begin += kUrnPrefix.size();
    }

    size_t end = input.find_last_not_of(kTrailingNoise);
    end = (end == std::string::npos || end < begin) ? begin : end + 1;

    const std::string body = input.substr(begin, end - begin);
    if (body.size() < kHexDigits) {
        return insufficient(input, body.size(), 0);
    }

    Bytes bytes{};
    size_t digits = 0;
    int high = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c == '-') continue;

        int v = hex_val(c);
        if (v < 0) {
            char code[8];
            std::snprintf(code, sizeof(code), "0x%02x",
                static_cast<unsigned>(static_cast<unsigned char>(c)));
            std::string reason = "Expected hexadecimal digit, but found '";
            reason += c;
            reason += "' (";
            reason += code;
            reason += ")";
            return parse_failure(UuidError::parse(
                UuidError::InvalidHexDigit, std::move(reason), input, i));
        }

        if (digits % 2 == 0) {
            high = v;
        } else if (digits / 2 < kSize) {
            bytes[digits / 2] = static_cast<uint8_t>((high << 4) | v);
        }
        ++digits;
    }

    // An unpaired trailing digit leaves nothing to decode into bytes, so an
    // odd count is measured in digits rather than bytes. Either way the
    // decoded length is what gets compared with 16.
    size_t decoded = (digits % 2 == 0) ? digits / 2 : digits;
    size_t last = decoded > 0 ? decoded - 1 : 0;

    if (decoded < kSize) {
        return insufficient(input, digits, last);
    }
    if (decoded > kSize) {
        UuidError e = UuidError::parse(UuidError::ExcessiveLength,
            "Expected no more than 32 hexadecimal digits", input, last);
        e.length = digits;
        return parse_failure(std::move(e));
    }

    return Result<Uuid>::ok(Uuid(bytes));
}

} // namespace uuidkit
