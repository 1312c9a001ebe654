#include <uuidkit/uuid.hpp>
#include <uuidkit/md5.hpp>
#include <uuidkit/sha1.hpp>
#include <cstring>

namespace uuidkit {

// Overwrite the version nibble and force the RFC 4122 variant bits.
Uuid Uuid::stamp(Bytes bytes, int version) {
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (version << 4));
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    return Uuid(bytes);
}

// ---- Name-based: hash(namespace bytes ++ name) ----

Uuid Uuid::v3(const Uuid& ns, const std::string& name) {
    MD5 ctx;
    ctx.update(ns.bytes_.data(), kSize);
    ctx.update(name);
    return stamp(ctx.finalize(), VersionNameBasedMD5);
}

Uuid Uuid::v5(const Uuid& ns, const std::string& name) {
    SHA1 ctx;
    ctx.update(ns.bytes_.data(), kSize);
    ctx.update(name);
    auto digest = ctx.finalize();

    // SHA-1 yields 20 bytes; the trailing 4 are dropped.
    Bytes bytes;
    std::memcpy(bytes.data(), digest.data(), kSize);
    return stamp(bytes, VersionNameBasedSHA1);
}

// ---- Random ----

Result<Uuid> Uuid::v4() {
    return v4(RandomSource(fill_secure_random));
}

Result<Uuid> Uuid::v4(const RandomSource& source) {
    if (!source) {
        return UuidError(UuidError::InvalidArg, "no random source supplied");
    }
    Bytes bytes;
    UUIDKIT_TRY(source(bytes.data(), kSize));
    return Result<Uuid>::ok(stamp(bytes, VersionRandom));
}

} // namespace uuidkit
