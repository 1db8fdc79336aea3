#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shortguid {

// Why a base64 string could not be decoded
struct DecodeError {
    enum Kind {
        InvalidByte,        // symbol outside the alphabet
        InvalidLength,      // symbol count leaves a 6-bit remainder
        InvalidLastSymbol,  // final symbol carries non-zero trailing bits
        InvalidPadding      // '=' padding where none is allowed
    };

    Kind kind;
    size_t offset = 0;  // InvalidByte, InvalidLastSymbol
    uint8_t byte = 0;   // InvalidByte, InvalidLastSymbol
    size_t length = 0;  // InvalidLength

    std::string to_string() const;
    bool operator==(const DecodeError& o) const;
    bool operator!=(const DecodeError& o) const;
};

namespace base64 {

enum class Alphabet {
    Standard,  // A-Z a-z 0-9 + /
    UrlSafe    // A-Z a-z 0-9 - _
};

enum class Padding { Emit, None };

// Number of characters encode() produces for `len` input bytes
size_t encoded_len(size_t len, Padding padding);

std::string encode(const uint8_t* data, size_t len, Alphabet alphabet, Padding padding);

// Strict decode: padding is never accepted and the unused bits of the
// final symbol must be zero, so every byte string has exactly one
// accepted encoding. On failure `out` is left in an unspecified state.
std::optional<DecodeError> decode(std::string_view input, Alphabet alphabet,
                                  std::vector<uint8_t>& out);

} // namespace base64
} // namespace shortguid
