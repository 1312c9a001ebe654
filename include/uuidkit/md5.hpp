#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace uuidkit {

// MD5 message digest (RFC 1321), kept for version 3 UUIDs.
class MD5 {
public:
    MD5();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalize and return the 16-byte digest. Object should not be
    // reused after this call.
    std::array<uint8_t, 16> finalize();

    static std::string hash_hex(const std::string& input);
    static std::string bytes_to_hex(const std::array<uint8_t, 16>& bytes);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 4> state_;   // A, B, C, D
    uint64_t total_bytes_;
    uint8_t  buffer_[64];
    size_t   buffer_len_;
};

} // namespace uuidkit
