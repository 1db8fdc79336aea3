#include <shortguid/serde.hpp>
#include <shortguid/log.hpp>

namespace shortguid::serde {

static GuidError parse_failed(const GuidError& err) {
    return GuidError{GuidError::Serialization, "ShortGuid parsing failed: " + err.message};
}

static GuidError expected(const std::string& what, const nlohmann::json& got) {
    return GuidError{GuidError::Serialization,
        std::string("invalid type: ") + got.type_name() + ", expected " + what};
}

// ---------------------------------------------------------------------------
// Serialize
// ---------------------------------------------------------------------------

nlohmann::json serialize(const ShortGuid& id, Mode mode) {
    if (mode == Mode::HumanReadable) {
        return nlohmann::json(id.to_string());
    }
    const Bytes& b = id.as_bytes();
    return nlohmann::json::binary(std::vector<uint8_t>(b.begin(), b.end()));
}

// ---------------------------------------------------------------------------
// Deserialize
// ---------------------------------------------------------------------------

static Result<ShortGuid> from_sequence(const nlohmann::json& arr) {
    if (arr.size() != 16) {
        return GuidError{GuidError::Serialization,
            "invalid length " + std::to_string(arr.size()) + ", expected a sequence of 16 bytes"};
    }

    Bytes bytes{};
    for (size_t i = 0; i < 16; ++i) {
        const auto& e = arr[i];
        if (!e.is_number_integer()) {
            return GuidError{GuidError::Serialization,
                std::string("invalid type: ") + e.type_name() +
                " at index " + std::to_string(i) + ", expected u8"};
        }
        bool in_range = e.is_number_unsigned()
            ? e.get<uint64_t>() <= 255
            : e.get<int64_t>() >= 0 && e.get<int64_t>() <= 255;
        if (!in_range) {
            return GuidError{GuidError::Serialization,
                "invalid value: integer " + e.dump() +
                " at index " + std::to_string(i) + ", expected u8"};
        }
        bytes[i] = static_cast<uint8_t>(e.get<int64_t>());
    }
    return Result<ShortGuid>::ok(ShortGuid::from_bytes(bytes));
}

static Result<ShortGuid> deserialize_readable(const nlohmann::json& value) {
    if (value.is_string()) {
        return ShortGuid::try_parse(value.get_ref<const std::string&>()).map_err(parse_failed);
    }
    if (value.is_binary()) {
        return ShortGuid::from_slice(value.get_binary()).map_err(parse_failed);
    }
    if (value.is_array()) {
        return from_sequence(value);
    }
    return expected("a ShortGuid string", value);
}

static Result<ShortGuid> deserialize_binary(const nlohmann::json& value) {
    if (!value.is_binary()) {
        return expected("16 raw bytes", value);
    }
    const auto& bin = value.get_binary();
    if (bin.size() != 16) {
        return GuidError{GuidError::Serialization,
            "UUID parsing failed: invalid length: expected 16 bytes, found " +
            std::to_string(bin.size())};
    }
    return ShortGuid::from_slice(bin);
}

Result<ShortGuid> deserialize(const nlohmann::json& value, Mode mode) {
    auto r = mode == Mode::HumanReadable ? deserialize_readable(value)
                                         : deserialize_binary(value);
    if (r.is_err()) {
        log::debug("deserialize %s: %s",
                   mode == Mode::HumanReadable ? "readable" : "binary",
                   r.error().message.c_str());
    }
    return r;
}

} // namespace shortguid::serde

namespace shortguid {

void to_json(nlohmann::json& j, const ShortGuid& id) {
    j = serde::serialize(id, serde::Mode::HumanReadable);
}

void from_json(const nlohmann::json& j, ShortGuid& id) {
    auto r = serde::deserialize(j, serde::Mode::HumanReadable);
    if (r.is_err()) {
        throw serde::DeserializeError(r.error());
    }
    id = r.value();
}

} // namespace shortguid
