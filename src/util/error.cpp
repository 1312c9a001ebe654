#include <uuidkit/error.hpp>

namespace uuidkit {

UuidError UuidError::parse(Code c, std::string reason, std::string input,
                           std::size_t position) {
    UuidError e(c, std::move(reason));
    e.input = std::move(input);
    e.position = position;
    return e;
}

UuidError UuidError::parse(Code c, std::string reason, std::string input,
                           std::size_t position, UuidError previous) {
    UuidError e = parse(c, std::move(reason), std::move(input), position);
    e.cause = std::make_shared<const UuidError>(std::move(previous));
    return e;
}

bool UuidError::is_parse_error() const {
    return code == InsufficientLength
        || code == ExcessiveLength
        || code == InvalidHexDigit;
}

const char* UuidError::code_name(Code c) {
    switch (c) {
        case InvalidLength:      return "InvalidLength";
        case InsufficientLength: return "InsufficientLength";
        case ExcessiveLength:    return "ExcessiveLength";
        case InvalidHexDigit:    return "InvalidHexDigit";
        case Entropy:            return "Entropy";
        case IO:                 return "IO";
        case Config:             return "Config";
        case InvalidArg:         return "InvalidArg";
    }
    return "Unknown";
}

std::string UuidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (is_parse_error()) {
        result += "\n  --> \"";
        result += input;
        result += "\" at position ";
        result += std::to_string(position);
    }

    for (auto c = cause; c; c = c->cause) {
        result += "\n  caused by: error[";
        result += code_name(c->code);
        result += "]: ";
        result += c->message;
    }

    return result;
}

} // namespace uuidkit
