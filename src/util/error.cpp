#include <shortguid/error.hpp>
#include <shortguid/base64.hpp>

namespace shortguid {

GuidError GuidError::invalid_length(size_t len) {
    GuidError e{InvalidLength,
        "Invalid ID length; expected 22 characters, but got " + std::to_string(len),
        "a ShortGuid is 22 URL-safe base64 characters or a 36 character UUID"};
    e.length = len;
    return e;
}

GuidError GuidError::invalid_format(const DecodeError& err) {
    return GuidError{InvalidFormat, "Invalid ID format: " + err.to_string(),
        "allowed characters are A-Z, a-z, 0-9, '-' and '_'"};
}

GuidError GuidError::invalid_slice(size_t len) {
    GuidError e{InvalidSlice,
        "Invalid slice: invalid length: expected 16 bytes, found " + std::to_string(len)};
    e.length = len;
    return e;
}

const char* GuidError::code_name(Code c) {
    switch (c) {
        case InvalidLength: return "InvalidLength";
        case InvalidFormat: return "InvalidFormat";
        case InvalidSlice:  return "InvalidSlice";
        case Serialization: return "Serialization";
        case Config:        return "Config";
        case IO:            return "IO";
        case InvalidArg:    return "InvalidArg";
    }
    return "Unknown";
}

std::string GuidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace shortguid
