#pragma once

#include <shortguid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace shortguid {

// 16 bytes in RFC 4122 network (big-endian) order
using Bytes = std::array<uint8_t, 16>;

// Canonical 128-bit UUID. Only the hyphenated 8-4-4-4-12 text form is
// parsed; output is always lowercase.
struct Uuid {
    Bytes bytes{};

    static Uuid v4();
    static Uuid nil();
    static Uuid from_bytes(const Bytes& b);
    static Uuid from_bytes_le(const Bytes& b);
    static Result<Uuid> from_slice(const uint8_t* data, size_t len);
    static Result<Uuid> from_string(std::string_view s);

    std::string to_string() const;
    std::string to_string_upper() const;
    // 32 hex digits without hyphens
    std::string to_hex() const;

    // Fields 1-3 byte-swapped, last 8 bytes unchanged (Microsoft GUID layout)
    Bytes to_bytes_le() const;

    bool is_nil() const;
    size_t hash() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
    bool operator<=(const Uuid& other) const;
    bool operator>(const Uuid& other) const;
    bool operator>=(const Uuid& other) const;
};

// Byte-swaps the first three UUID fields; applying it twice is the identity
Bytes swap_fields(const Bytes& b);

// FNV-1a over the 16 bytes; stable across platforms and runs
size_t hash_bytes(const Bytes& b);

std::ostream& operator<<(std::ostream& os, const Uuid& u);

} // namespace shortguid

namespace std {
template<>
struct hash<shortguid::Uuid> {
    size_t operator()(const shortguid::Uuid& u) const { return u.hash(); }
};
} // namespace std
