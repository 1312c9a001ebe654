#include <uuidkit/uuid.hpp>
#include <cstring>
#include <istream>
#include <ostream>

namespace uuidkit {

static const char hex_chars[] = "0123456789abcdef";

static UuidError invalid_length(size_t got) {
    UuidError e(UuidError::InvalidLength,
        "Expected exactly 16 bytes, but got " + std::to_string(got));
    e.length = got;
    return e;
}

// ---- Construction ----

Result<Uuid> Uuid::from_bytes(const uint8_t* data, size_t len) {
    if (len != kSize || data == nullptr) {
        return invalid_length(data == nullptr ? 0 : len);
    }
    Bytes bytes;
    std::memcpy(bytes.data(), data, kSize);
    return Result<Uuid>::ok(Uuid(bytes));
}

Result<Uuid> Uuid::from_bytes(const std::string& binary) {
    return from_bytes(reinterpret_cast<const uint8_t*>(binary.data()), binary.size());
}

Result<Uuid> Uuid::from_bytes(const std::vector<uint8_t>& binary) {
    return from_bytes(binary.data(), binary.size());
}

Uuid Uuid::from_array(const Bytes& bytes) {
    return Uuid(bytes);
}

Result<Uuid> Uuid::read(std::istream& in) {
    Bytes bytes;
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(kSize));
    auto got = static_cast<size_t>(in.gcount());
    if (got != kSize) {
        return invalid_length(got);
    }
    return Result<Uuid>::ok(Uuid(bytes));
}

// ---- Well-known values (RFC 4122 appendix C) ----

Uuid Uuid::nil() {
    return Uuid(Bytes{});
}

Uuid Uuid::namespace_dns() {
    return Uuid(Bytes{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                      0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
}

Uuid Uuid::namespace_url() {
    return Uuid(Bytes{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                      0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
}

Uuid Uuid::namespace_oid() {
    return Uuid(Bytes{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                      0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
}

Uuid Uuid::namespace_x500() {
    return Uuid(Bytes{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                      0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});
}

// ---- Accessors ----

Uuid::Variant Uuid::variant() const {
    uint8_t b = bytes_[8];
    if ((b & 0xC0) == 0x80) return VariantRFC4122;
    if ((b & 0xE0) == 0xC0) return VariantMicrosoft;
    if ((b & 0x80) == 0x00) return VariantNCS;
    return VariantFutureReserved;
}

int Uuid::version() const {
    return bytes_[6] >> 4;
}

bool Uuid::is_nil() const {
    for (uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

std::string Uuid::to_binary() const {
    return std::string(reinterpret_cast<const char*>(bytes_.data()), kSize);
}

std::string Uuid::to_hex() const {
    std::string out;
    out.reserve(32);
    for (uint8_t b : bytes_) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

// xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
std::string Uuid::to_string() const {
    std::string hex = to_hex();
    std::string out;
    out.reserve(36);
    out.append(hex, 0, 8).append(1, '-')
       .append(hex, 8, 4).append(1, '-')
       .append(hex, 12, 4).append(1, '-')
       .append(hex, 16, 4).append(1, '-')
       .append(hex, 20, 12);
    return out;
}

void Uuid::write(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(bytes_.data()), static_cast<std::streamsize>(kSize));
}

std::ostream& operator<<(std::ostream& out, const Uuid& uuid) {
    return out << uuid.to_string();
}

} // namespace uuidkit

namespace std {

// 64-bit FNV-1a over the 16 bytes.
size_t hash<uuidkit::Uuid>::operator()(const uuidkit::Uuid& uuid) const noexcept {
    uint64_t h = 0xcbf29ce484222325ull;
    for (uint8_t b : uuid.bytes()) {
        h ^= b;
        h *= 0x100000001b3ull;
    }
    return static_cast<size_t>(h);
}

} // namespace std
