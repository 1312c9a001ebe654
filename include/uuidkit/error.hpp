#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace uuidkit {

struct UuidError {
    enum Code {
        InvalidLength,
        InsufficientLength,
        ExcessiveLength,
        InvalidHexDigit,
        Entropy,
        IO,
        Config,
        InvalidArg
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;
    // Parse failures: the unmodified text handed to the parser and the
    // zero-based offset where the failure was detected.
    std::string input;
    std::size_t position = 0;
    // Observed byte/digit count for the length errors.
    std::size_t length = 0;
    std::shared_ptr<const UuidError> cause;

    UuidError() = default;
    UuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UuidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Build a parse failure for `input`, optionally chaining the error that
    // caused it.
    static UuidError parse(Code c, std::string reason, std::string input,
                           std::size_t position = 0);
    static UuidError parse(Code c, std::string reason, std::string input,
                           std::size_t position, UuidError previous);

    bool is_parse_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace uuidkit
