#include <shortguid/short_guid.hpp>
#include <algorithm>

namespace shortguid {

// ---------------------------------------------------------------------------
// Named comparisons
// ---------------------------------------------------------------------------

bool ShortGuid::equals_identifier(const ShortGuid& other) const {
    return uuid_.bytes == other.uuid_.bytes;
}

bool ShortGuid::equals_canonical(const Uuid& uuid) const {
    return uuid_.bytes == uuid.bytes;
}

bool ShortGuid::equals_text(std::string_view text) const {
    auto decoded = try_decode(text);
    if (decoded.is_ok()) {
        return equals_canonical(decoded.value());
    }

    auto parsed = Uuid::from_string(text);
    if (parsed.is_ok()) {
        return equals_canonical(parsed.value());
    }

    return false;
}

bool ShortGuid::equals_bytes(const uint8_t* data, size_t len) const {
    if (len != 16 || data == nullptr) return false;
    return std::equal(uuid_.bytes.begin(), uuid_.bytes.end(), data);
}

// ---------------------------------------------------------------------------
// Operators
// ---------------------------------------------------------------------------

bool operator==(const ShortGuid& a, const ShortGuid& b) { return a.equals_identifier(b); }
bool operator!=(const ShortGuid& a, const ShortGuid& b) { return !a.equals_identifier(b); }

bool operator==(const ShortGuid& a, const Uuid& b) { return a.equals_canonical(b); }
bool operator!=(const ShortGuid& a, const Uuid& b) { return !a.equals_canonical(b); }
bool operator==(const Uuid& a, const ShortGuid& b) { return b.equals_canonical(a); }
bool operator!=(const Uuid& a, const ShortGuid& b) { return !b.equals_canonical(a); }

bool operator==(const ShortGuid& a, std::string_view b) { return a.equals_text(b); }
bool operator!=(const ShortGuid& a, std::string_view b) { return !a.equals_text(b); }
bool operator==(std::string_view a, const ShortGuid& b) { return b.equals_text(a); }
bool operator!=(std::string_view a, const ShortGuid& b) { return !b.equals_text(a); }

bool operator==(const ShortGuid& a, const std::vector<uint8_t>& b) {
    return a.equals_bytes(b.data(), b.size());
}
bool operator!=(const ShortGuid& a, const std::vector<uint8_t>& b) { return !(a == b); }
bool operator==(const std::vector<uint8_t>& a, const ShortGuid& b) { return b == a; }
bool operator!=(const std::vector<uint8_t>& a, const ShortGuid& b) { return !(b == a); }

bool operator==(const ShortGuid& a, const Bytes& b) { return a.as_bytes() == b; }
bool operator!=(const ShortGuid& a, const Bytes& b) { return a.as_bytes() != b; }
bool operator==(const Bytes& a, const ShortGuid& b) { return b.as_bytes() == a; }
bool operator!=(const Bytes& a, const ShortGuid& b) { return b.as_bytes() != a; }

bool operator==(const ShortGuidRef& a, const ShortGuidRef& b) { return a.as_bytes() == b.as_bytes(); }
bool operator!=(const ShortGuidRef& a, const ShortGuidRef& b) { return a.as_bytes() != b.as_bytes(); }
bool operator==(const ShortGuid& a, const ShortGuidRef& b) { return a.as_bytes() == b.as_bytes(); }
bool operator!=(const ShortGuid& a, const ShortGuidRef& b) { return a.as_bytes() != b.as_bytes(); }
bool operator==(const ShortGuidRef& a, const ShortGuid& b) { return a.as_bytes() == b.as_bytes(); }
bool operator!=(const ShortGuidRef& a, const ShortGuid& b) { return a.as_bytes() != b.as_bytes(); }

bool operator==(const ShortGuidRef& a, const Uuid& b) { return a.equals_canonical(b); }
bool operator!=(const ShortGuidRef& a, const Uuid& b) { return !a.equals_canonical(b); }
bool operator==(const Uuid& a, const ShortGuidRef& b) { return b.equals_canonical(a); }
bool operator!=(const Uuid& a, const ShortGuidRef& b) { return !b.equals_canonical(a); }

bool operator==(const ShortGuidRef& a, std::string_view b) { return a.equals_text(b); }
bool operator!=(const ShortGuidRef& a, std::string_view b) { return !a.equals_text(b); }
bool operator==(std::string_view a, const ShortGuidRef& b) { return b.equals_text(a); }
bool operator!=(std::string_view a, const ShortGuidRef& b) { return !b.equals_text(a); }

bool operator==(const ShortGuidRef& a, const std::vector<uint8_t>& b) {
    return a.equals_bytes(b.data(), b.size());
}
bool operator!=(const ShortGuidRef& a, const std::vector<uint8_t>& b) { return !(a == b); }
bool operator==(const std::vector<uint8_t>& a, const ShortGuidRef& b) { return b == a; }
bool operator!=(const std::vector<uint8_t>& a, const ShortGuidRef& b) { return !(b == a); }

bool operator==(const ShortGuidRef& a, const Bytes& b) { return a.as_bytes() == b; }
bool operator!=(const ShortGuidRef& a, const Bytes& b) { return a.as_bytes() != b; }
bool operator==(const Bytes& a, const ShortGuidRef& b) { return b.as_bytes() == a; }
bool operator!=(const Bytes& a, const ShortGuidRef& b) { return b.as_bytes() != a; }

// Lexicographic over the 16 bytes, consistent with operator==
bool operator<(const ShortGuid& a, const ShortGuid& b) { return a.as_uuid() < b.as_uuid(); }
bool operator<=(const ShortGuid& a, const ShortGuid& b) { return a.as_uuid() <= b.as_uuid(); }
bool operator>(const ShortGuid& a, const ShortGuid& b) { return a.as_uuid() > b.as_uuid(); }
bool operator>=(const ShortGuid& a, const ShortGuid& b) { return a.as_uuid() >= b.as_uuid(); }

} // namespace shortguid
