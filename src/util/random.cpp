#include <uuidkit/random.hpp>
#include <uuidkit/log.hpp>
#include <fstream>
#include <string>

namespace uuidkit {

static const char* const kEntropyDevice = "/dev/urandom";

Status fill_secure_random(uint8_t* buf, size_t len) {
    std::ifstream urandom(kEntropyDevice, std::ios::binary);
    if (!urandom.is_open()) {
        log::error("cannot open %s", kEntropyDevice);
        return UuidError(UuidError::Entropy,
            std::string("cannot open entropy source ") + kEntropyDevice,
            "random UUIDs require a working kernel random number generator");
    }

    urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    auto got = static_cast<size_t>(urandom.gcount());
    if (got != len) {
        log::error("short read from %s: wanted %zu bytes, got %zu", kEntropyDevice, len, got);
        return UuidError(UuidError::Entropy,
            "entropy source returned " + std::to_string(got) + " of "
                + std::to_string(len) + " requested bytes");
    }
    return ok_status();
}

} // namespace uuidkit
