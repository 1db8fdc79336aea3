#include <shortguid/short_guid.hpp>
#include <shortguid/base64.hpp>

namespace shortguid {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ShortGuid ShortGuid::new_random() {
    return ShortGuid(Uuid::v4());
}

ShortGuid ShortGuid::new_from_uuid(const Uuid& uuid) {
    return ShortGuid(uuid);
}

ShortGuid ShortGuid::from_bytes(const Bytes& bytes) {
    return ShortGuid(Uuid::from_bytes(bytes));
}

ShortGuidRef ShortGuid::from_bytes_ref(const Bytes& bytes) {
    return ShortGuidRef(bytes);
}

Result<ShortGuid> ShortGuid::from_slice(const uint8_t* data, size_t len) {
    return Uuid::from_slice(data, len).map([](const Uuid& u) { return ShortGuid(u); });
}

Result<ShortGuid> ShortGuid::from_slice(const std::vector<uint8_t>& bytes) {
    return from_slice(bytes.data(), bytes.size());
}

Result<ShortGuid> ShortGuid::from_slice(std::string_view bytes) {
    return from_slice(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

Result<ShortGuid> ShortGuid::try_parse(std::string_view value) {
    auto uuid = Uuid::from_string(value);
    if (uuid.is_ok()) {
        return Result<ShortGuid>::ok(ShortGuid(uuid.value()));
    }
    return try_decode(value).map([](const Uuid& u) { return ShortGuid(u); });
}

Result<Uuid> ShortGuid::try_decode(std::string_view value) {
    // Lenient: no characters means the nil id
    if (value.empty()) {
        return Result<Uuid>::ok(Uuid::nil());
    }

    if (value.size() != 22) {
        return GuidError::invalid_length(value.size());
    }

    std::vector<uint8_t> decoded;
    if (auto err = base64::decode(value, base64::Alphabet::UrlSafe, decoded)) {
        return GuidError::invalid_format(*err);
    }

    if (decoded.size() != 16) {
        return GuidError::invalid_length(decoded.size());
    }
    return Uuid::from_slice(decoded.data(), decoded.size());
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

std::string ShortGuid::encode(const Bytes& bytes) {
    return base64::encode(bytes.data(), bytes.size(),
                          base64::Alphabet::UrlSafe, base64::Padding::None);
}

std::string ShortGuid::encode(const Uuid& uuid) {
    return encode(uuid.bytes);
}

std::string ShortGuid::to_string() const {
    return encode(uuid_);
}

std::string ShortGuid::debug_string() const {
    return encode(uuid_) + " (" + uuid_.to_string() + ")";
}

std::ostream& operator<<(std::ostream& os, const ShortGuid& id) {
    return os << id.to_string();
}

std::ostream& operator<<(std::ostream& os, const ShortGuidRef& id) {
    return os << id.to_string();
}

} // namespace shortguid
