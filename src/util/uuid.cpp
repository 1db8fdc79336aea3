#include <shortguid/uuid.hpp>
#include <algorithm>
#include <fstream>
#include <random>

namespace shortguid {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    // Fallback: std::random_device + mt19937_64
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

// ---- Hex helpers ----

static const char hex_lower[] = "0123456789abcdef";
static const char hex_upper[] = "0123456789ABCDEF";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string format_hex(const Bytes& bytes, const char* digits, bool hyphens) {
    std::string out;
    out.reserve(hyphens ? 36 : 32);
    for (int i = 0; i < 16; ++i) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
        if (hyphens && (i == 3 || i == 5 || i == 7 || i == 9)) {
            out += '-';
        }
    }
    return out;
}

// ---- Construction ----

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);
    // Set version 4: bytes[6] high nibble = 0100
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
    // Set variant 1: bytes[8] top two bits = 10
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return u;
}

Uuid Uuid::nil() {
    return Uuid{};
}

Uuid Uuid::from_bytes(const Bytes& b) {
    return Uuid{b};
}

Uuid Uuid::from_bytes_le(const Bytes& b) {
    return Uuid{swap_fields(b)};
}

Result<Uuid> Uuid::from_slice(const uint8_t* data, size_t len) {
    if (len != 16 || data == nullptr) {
        return GuidError::invalid_slice(data == nullptr ? 0 : len);
    }
    Uuid u;
    std::copy(data, data + 16, u.bytes.begin());
    return Result<Uuid>::ok(u);
}

// ---- from_string: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx ----

Result<Uuid> Uuid::from_string(std::string_view s) {
    if (s.size() != 36) {
        return GuidError(GuidError::InvalidFormat,
            "UUID string must be 36 characters, got " + std::to_string(s.size()),
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return GuidError(GuidError::InvalidFormat,
            "UUID string has invalid dash positions",
            "Expected dashes at positions 8, 13, 18, 23");
    }

    // Offset of the first hex digit of each byte; dashes sit at 8, 13, 18, 23
    static const size_t byte_offsets[16] = {
        0, 2, 4, 6, 9, 11, 14, 16, 19, 21, 24, 26, 28, 30, 32, 34,
    };

    Uuid u;
    for (size_t b = 0; b < 16; ++b) {
        size_t i = byte_offsets[b];
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return GuidError(GuidError::InvalidFormat,
                "UUID string contains invalid hex character",
                "Invalid char at position " + std::to_string(hi < 0 ? i : i + 1));
        }
        u.bytes[b] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<Uuid>::ok(u);
}

// ---- Formatting ----

std::string Uuid::to_string() const {
    return format_hex(bytes, hex_lower, true);
}

std::string Uuid::to_string_upper() const {
    return format_hex(bytes, hex_upper, true);
}

std::string Uuid::to_hex() const {
    return format_hex(bytes, hex_lower, false);
}

std::ostream& operator<<(std::ostream& os, const Uuid& u) {
    return os << u.to_string();
}

// ---- Byte order ----

Bytes swap_fields(const Bytes& b) {
    return Bytes{
        b[3], b[2], b[1], b[0],
        b[5], b[4],
        b[7], b[6],
        b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15],
    };
}

Bytes Uuid::to_bytes_le() const {
    return swap_fields(bytes);
}

// ---- Identity ----

bool Uuid::is_nil() const {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

size_t hash_bytes(const Bytes& b) {
    uint64_t h = 14695981039346656037ULL;
    for (uint8_t byte : b) {
        h ^= byte;
        h *= 1099511628211ULL;
    }
    return static_cast<size_t>(h);
}

size_t Uuid::hash() const {
    return hash_bytes(bytes);
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

// std::array compares lexicographically, which is network byte order here
bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

bool Uuid::operator<=(const Uuid& other) const {
    return bytes <= other.bytes;
}

bool Uuid::operator>(const Uuid& other) const {
    return bytes > other.bytes;
}

bool Uuid::operator>=(const Uuid& other) const {
    return bytes >= other.bytes;
}

} // namespace shortguid
