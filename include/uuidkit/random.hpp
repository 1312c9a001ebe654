#pragma once

#include <uuidkit/result.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace uuidkit {

// Fills `len` bytes of `buf` or fails. Implementations must never hand back
// weaker randomness on failure.
using RandomSource = std::function<Status(uint8_t* buf, size_t len)>;

// Kernel CSPRNG (/dev/urandom). Errors with UuidError::Entropy when the
// device cannot be opened or returns fewer than `len` bytes.
Status fill_secure_random(uint8_t* buf, size_t len);

} // namespace uuidkit
