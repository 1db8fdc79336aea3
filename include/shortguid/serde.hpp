#pragma once

#include <shortguid/result.hpp>
#include <shortguid/short_guid.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace shortguid::serde {

enum class Mode {
    // Text formats (JSON): the 22 character string
    HumanReadable,
    // Binary formats (CBOR, MessagePack, BSON): the 16 raw bytes
    Binary
};

nlohmann::json serialize(const ShortGuid& id, Mode mode);

// HumanReadable accepts a ShortGuid or UUID string, a 16 byte binary
// value, or an array of 16 integers in 0..255. Binary accepts only a
// 16 byte binary value. Failures carry GuidError::Serialization.
Result<ShortGuid> deserialize(const nlohmann::json& value, Mode mode);

// Thrown by the nlohmann from_json hook, which cannot return a Result
class DeserializeError : public std::runtime_error {
public:
    explicit DeserializeError(const GuidError& err)
        : std::runtime_error(err.message), error_(err) {}

    const GuidError& error() const { return error_; }

private:
    GuidError error_;
};

} // namespace shortguid::serde

namespace shortguid {

// nlohmann ADL hooks, always human-readable:
//   nlohmann::json j = id;
//   auto back = j.get<ShortGuid>();
void to_json(nlohmann::json& j, const ShortGuid& id);
void from_json(const nlohmann::json& j, ShortGuid& id);

} // namespace shortguid
