#pragma once

#include <shortguid/result.hpp>
#include <shortguid/uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace shortguid {

class ShortGuidRef;

// A UUID rendered as 22 URL-safe base64 characters.
//
//   auto a = ShortGuid::try_parse("c9a646d3-9c61-4cb7-bfcd-ee2522c8f633").value();
//   auto b = ShortGuid::try_parse("yaZG05xhTLe_ze4lIsj2Mw").value();
//   a == b;                          // true
//   a == "yaZG05xhTLe_ze4lIsj2Mw";   // true
//
// The only state is the 16 UUID bytes; the default value is the nil UUID.
class ShortGuid {
public:
    ShortGuid() = default;
    explicit ShortGuid(const Uuid& uuid) : uuid_(uuid) {}

    // Wraps a random version 4 UUID
    static ShortGuid new_random();
    static ShortGuid new_from_uuid(const Uuid& uuid);

    // Accepts a hyphenated UUID or a 22 character ShortGuid string.
    // The hyphenated form is tried first.
    static Result<ShortGuid> try_parse(std::string_view value);

    // Fails with InvalidSlice unless exactly 16 bytes are supplied
    static Result<ShortGuid> from_slice(const uint8_t* data, size_t len);
    static Result<ShortGuid> from_slice(const std::vector<uint8_t>& bytes);
    static Result<ShortGuid> from_slice(std::string_view bytes);

    // Copies the bytes
    static ShortGuid from_bytes(const Bytes& bytes);

    // Borrows the bytes without copying; `bytes` must outlive the view
    static ShortGuidRef from_bytes_ref(const Bytes& bytes);

    // Decodes a 22 character URL-safe base64 string. The empty string
    // decodes to the nil UUID.
    static Result<Uuid> try_decode(std::string_view value);

    // Always returns exactly 22 characters
    static std::string encode(const Uuid& uuid);
    static std::string encode(const Bytes& bytes);

    const Bytes& as_bytes() const { return uuid_.bytes; }
    Bytes to_bytes_le() const { return uuid_.to_bytes_le(); }
    bool is_empty() const { return uuid_.is_nil(); }
    const Uuid& as_uuid() const { return uuid_; }

    // "yaZG05xhTLe_ze4lIsj2Mw"
    std::string to_string() const;
    // "yaZG05xhTLe_ze4lIsj2Mw (c9a646d3-9c61-4cb7-bfcd-ee2522c8f633)"
    std::string debug_string() const;

    size_t hash() const { return hash_bytes(uuid_.bytes); }

    bool equals_identifier(const ShortGuid& other) const;
    bool equals_canonical(const Uuid& uuid) const;
    // Compact form first, then hyphenated UUID; unparseable text is unequal
    bool equals_text(std::string_view text) const;
    // Unequal unless `len` is exactly 16
    bool equals_bytes(const uint8_t* data, size_t len) const;

private:
    Uuid uuid_;
};

static_assert(sizeof(ShortGuid) == 16, "ShortGuid must be exactly 16 bytes");
static_assert(alignof(ShortGuid) == 1, "ShortGuid must be byte aligned");
static_assert(std::is_standard_layout<ShortGuid>::value, "ShortGuid must be standard layout");
static_assert(std::is_trivially_copyable<ShortGuid>::value, "ShortGuid must be trivially copyable");

// Read-only view of a ShortGuid stored in someone else's 16-byte buffer.
// as_bytes() refers to that buffer.
class ShortGuidRef {
public:
    explicit ShortGuidRef(const Bytes& bytes) : bytes_(&bytes) {}

    const Bytes& as_bytes() const { return *bytes_; }
    ShortGuid to_short_guid() const { return ShortGuid::from_bytes(*bytes_); }
    Uuid to_uuid() const { return Uuid::from_bytes(*bytes_); }
    Bytes to_bytes_le() const { return swap_fields(*bytes_); }
    bool is_empty() const { return to_uuid().is_nil(); }

    std::string to_string() const { return ShortGuid::encode(*bytes_); }
    std::string debug_string() const { return to_short_guid().debug_string(); }

    bool equals_canonical(const Uuid& uuid) const { return *bytes_ == uuid.bytes; }
    bool equals_text(std::string_view text) const { return to_short_guid().equals_text(text); }
    bool equals_bytes(const uint8_t* data, size_t len) const {
        return to_short_guid().equals_bytes(data, len);
    }

private:
    const Bytes* bytes_;
};

// ---- Equality ----

bool operator==(const ShortGuid& a, const ShortGuid& b);
bool operator!=(const ShortGuid& a, const ShortGuid& b);

bool operator==(const ShortGuid& a, const Uuid& b);
bool operator!=(const ShortGuid& a, const Uuid& b);
bool operator==(const Uuid& a, const ShortGuid& b);
bool operator!=(const Uuid& a, const ShortGuid& b);

bool operator==(const ShortGuid& a, std::string_view b);
bool operator!=(const ShortGuid& a, std::string_view b);
bool operator==(std::string_view a, const ShortGuid& b);
bool operator!=(std::string_view a, const ShortGuid& b);

bool operator==(const ShortGuid& a, const std::vector<uint8_t>& b);
bool operator!=(const ShortGuid& a, const std::vector<uint8_t>& b);
bool operator==(const std::vector<uint8_t>& a, const ShortGuid& b);
bool operator!=(const std::vector<uint8_t>& a, const ShortGuid& b);

bool operator==(const ShortGuid& a, const Bytes& b);
bool operator!=(const ShortGuid& a, const Bytes& b);
bool operator==(const Bytes& a, const ShortGuid& b);
bool operator!=(const Bytes& a, const ShortGuid& b);

bool operator==(const ShortGuidRef& a, const ShortGuidRef& b);
bool operator!=(const ShortGuidRef& a, const ShortGuidRef& b);
bool operator==(const ShortGuid& a, const ShortGuidRef& b);
bool operator!=(const ShortGuid& a, const ShortGuidRef& b);
bool operator==(const ShortGuidRef& a, const ShortGuid& b);
bool operator!=(const ShortGuidRef& a, const ShortGuid& b);

bool operator==(const ShortGuidRef& a, const Uuid& b);
bool operator!=(const ShortGuidRef& a, const Uuid& b);
bool operator==(const Uuid& a, const ShortGuidRef& b);
bool operator!=(const Uuid& a, const ShortGuidRef& b);

bool operator==(const ShortGuidRef& a, std::string_view b);
bool operator!=(const ShortGuidRef& a, std::string_view b);
bool operator==(std::string_view a, const ShortGuidRef& b);
bool operator!=(std::string_view a, const ShortGuidRef& b);

bool operator==(const ShortGuidRef& a, const std::vector<uint8_t>& b);
bool operator!=(const ShortGuidRef& a, const std::vector<uint8_t>& b);
bool operator==(const std::vector<uint8_t>& a, const ShortGuidRef& b);
bool operator!=(const std::vector<uint8_t>& a, const ShortGuidRef& b);

bool operator==(const ShortGuidRef& a, const Bytes& b);
bool operator!=(const ShortGuidRef& a, const Bytes& b);
bool operator==(const Bytes& a, const ShortGuidRef& b);
bool operator!=(const Bytes& a, const ShortGuidRef& b);

// ---- Ordering (network byte order) ----

bool operator<(const ShortGuid& a, const ShortGuid& b);
bool operator<=(const ShortGuid& a, const ShortGuid& b);
bool operator>(const ShortGuid& a, const ShortGuid& b);
bool operator>=(const ShortGuid& a, const ShortGuid& b);

// Writes the 22 character form
std::ostream& operator<<(std::ostream& os, const ShortGuid& id);
std::ostream& operator<<(std::ostream& os, const ShortGuidRef& id);

} // namespace shortguid

namespace std {
template<>
struct hash<shortguid::ShortGuid> {
    size_t operator()(const shortguid::ShortGuid& id) const { return id.hash(); }
};
} // namespace std
