#pragma once

#include <uuidkit/random.hpp>
#include <uuidkit/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace uuidkit {

// RFC 4122 universally unique identifier.
//
// A Uuid is always exactly 16 bytes in network byte order and never changes
// after construction. Values come from from_bytes(), parse(), read(), the
// v3/v4/v5 generators or one of the well-known constants. Any variant and
// version is accepted on input; only the generators pick bit patterns.
class Uuid {
public:
    static constexpr size_t kSize = 16;
    using Bytes = std::array<uint8_t, kSize>;

    // Layout family, decoded from the top bits of byte 8.
    enum Variant {
        VariantNCS            = 0,
        VariantRFC4122        = 1,
        VariantMicrosoft      = 2,
        VariantFutureReserved = 3
    };

    // Generation algorithm, the high nibble of byte 6. Only 3, 4 and 5 are
    // produced here.
    enum Version {
        VersionTimeBased      = 1,
        VersionDceSecurity    = 2,
        VersionNameBasedMD5   = 3,
        VersionRandom         = 4,
        VersionNameBasedSHA1  = 5
    };

    // ---- Construction ----

    // Exactly 16 bytes of any content. Fails with InvalidLength otherwise.
    static Result<Uuid> from_bytes(const uint8_t* data, size_t len);
    static Result<Uuid> from_bytes(const std::string& binary);
    static Result<Uuid> from_bytes(const std::vector<uint8_t>& binary);
    static Uuid from_array(const Bytes& bytes);

    // Lenient text parser. Accepts plain hex, the canonical 8-4-4-4-12 form,
    // "urn:uuid:" URNs and Microsoft braces, tolerating surrounding blanks,
    // braces and stray hyphens. Content must be exactly 32 hex digits.
    static Result<Uuid> parse(const std::string& input);

    // Reads 16 raw bytes written by write(). A short read is InvalidLength.
    static Result<Uuid> read(std::istream& in);

    // ---- Generation ----

    static Uuid v3(const Uuid& ns, const std::string& name);
    static Result<Uuid> v4();
    static Result<Uuid> v4(const RandomSource& source);
    static Uuid v5(const Uuid& ns, const std::string& name);

    // ---- Well-known values ----

    static Uuid nil();
    static Uuid namespace_dns();
    static Uuid namespace_url();
    static Uuid namespace_oid();
    static Uuid namespace_x500();

    // ---- Accessors ----

    Variant variant() const;
    int version() const;
    bool is_nil() const;

    const Bytes& bytes() const { return bytes_; }
    std::string to_binary() const;
    std::string to_hex() const;
    std::string to_string() const;
    void write(std::ostream& out) const;

    bool operator==(const Uuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Uuid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Uuid& other) const { return bytes_ < other.bytes_; }
    bool operator>(const Uuid& other) const { return bytes_ > other.bytes_; }
    bool operator<=(const Uuid& other) const { return bytes_ <= other.bytes_; }
    bool operator>=(const Uuid& other) const { return bytes_ >= other.bytes_; }

private:
    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    static Uuid stamp(Bytes bytes, int version);

    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& out, const Uuid& uuid);

} // namespace uuidkit

namespace std {

template<>
struct hash<uuidkit::Uuid> {
    size_t operator()(const uuidkit::Uuid& uuid) const noexcept;
};

} // namespace std
