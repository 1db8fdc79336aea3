#include <shortguid/base64.hpp>

namespace shortguid {

// ---------------------------------------------------------------------------
// DecodeError
// ---------------------------------------------------------------------------

std::string DecodeError::to_string() const {
    switch (kind) {
        case InvalidByte:
            return "Invalid symbol " + std::to_string(byte) +
                   ", offset " + std::to_string(offset) + ".";
        case InvalidLength:
            return "Invalid input length: " + std::to_string(length);
        case InvalidLastSymbol:
            return "Invalid last symbol " + std::to_string(byte) +
                   ", offset " + std::to_string(offset) + ".";
        case InvalidPadding:
            return "Invalid padding";
    }
    return "Unknown decode error";
}

bool DecodeError::operator==(const DecodeError& o) const {
    return kind == o.kind && offset == o.offset && byte == o.byte && length == o.length;
}

bool DecodeError::operator!=(const DecodeError& o) const {
    return !(*this == o);
}

namespace base64 {

// ---- Alphabets ----

static const char standard_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
static const char url_safe_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

static const char* alphabet_chars(Alphabet alphabet) {
    return alphabet == Alphabet::UrlSafe ? url_safe_chars : standard_chars;
}

// 6-bit value of a symbol, or -1 if it is not part of the alphabet
static int symbol_val(unsigned char c, Alphabet alphabet) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (alphabet == Alphabet::UrlSafe) {
        if (c == '-') return 62;
        if (c == '_') return 63;
    } else {
        if (c == '+') return 62;
        if (c == '/') return 63;
    }
    return -1;
}

// ---- Encode ----

size_t encoded_len(size_t len, Padding padding) {
    size_t full = (len / 3) * 4;
    size_t rem = len % 3;
    if (rem == 0) return full;
    return full + (padding == Padding::Emit ? 4 : rem + 1);
}

std::string encode(const uint8_t* data, size_t len, Alphabet alphabet, Padding padding) {
    const char* chars = alphabet_chars(alphabet);
    std::string out;
    out.reserve(encoded_len(len, padding));

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out += chars[(n >> 18) & 0x3F];
        out += chars[(n >> 12) & 0x3F];
        out += chars[(n >> 6) & 0x3F];
        out += chars[n & 0x3F];
    }

    size_t rem = len - i;
    if (rem == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += chars[(n >> 18) & 0x3F];
        out += chars[(n >> 12) & 0x3F];
        if (padding == Padding::Emit) out += "==";
    } else if (rem == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8);
        out += chars[(n >> 18) & 0x3F];
        out += chars[(n >> 12) & 0x3F];
        out += chars[(n >> 6) & 0x3F];
        if (padding == Padding::Emit) out += '=';
    }
    return out;
}

// ---- Decode ----

std::optional<DecodeError> decode(std::string_view input, Alphabet alphabet,
                                  std::vector<uint8_t>& out) {
    out.clear();
    out.reserve((input.size() * 3) / 4);

    uint32_t accumulator = 0;
    int bits_collected = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c == '=') {
            // Trailing '=' run is padding; anywhere else it is a stray symbol
            size_t j = i;
            while (j < input.size() && input[j] == '=') ++j;
            if (j == input.size()) {
                return DecodeError{DecodeError::InvalidPadding};
            }
            return DecodeError{DecodeError::InvalidByte, i, c};
        }
        int v = symbol_val(c, alphabet);
        if (v < 0) {
            return DecodeError{DecodeError::InvalidByte, i, c};
        }
        accumulator = (accumulator << 6) | static_cast<uint32_t>(v);
        bits_collected += 6;
        if (bits_collected >= 8) {
            bits_collected -= 8;
            out.push_back(static_cast<uint8_t>((accumulator >> bits_collected) & 0xFF));
        }
    }

    // One symbol past a full quantum carries only 6 bits: not a byte
    if (input.size() % 4 == 1) {
        DecodeError err{DecodeError::InvalidLength};
        err.length = input.size();
        return err;
    }

    // Leftover bits below the last whole byte must be zero
    if (bits_collected > 0) {
        uint32_t mask = (1u << bits_collected) - 1;
        if ((accumulator & mask) != 0) {
            size_t last = input.size() - 1;
            return DecodeError{DecodeError::InvalidLastSymbol, last,
                               static_cast<uint8_t>(input[last])};
        }
    }

    return std::nullopt;
}

} // namespace base64
} // namespace shortguid
