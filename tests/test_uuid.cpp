#include <catch2/catch.hpp>
#include <shortguid/uuid.hpp>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

using namespace shortguid;

static const Bytes kFields = {
    0xa1, 0xa2, 0xa3, 0xa4,
    0xb1, 0xb2,
    0xc1, 0xc2,
    0xd1, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6, 0xd7, 0xd8,
};

TEST_CASE("UUID v4 version bits", "[uuid]") {
    auto u = Uuid::v4();
    // bytes[6] high nibble must be 0x4 (version 4)
    REQUIRE((u.bytes[6] & 0xF0) == 0x40);
}

TEST_CASE("UUID v4 variant bits", "[uuid]") {
    auto u = Uuid::v4();
    // bytes[8] top two bits must be 10 (variant 1)
    REQUIRE((u.bytes[8] & 0xC0) == 0x80);
}

TEST_CASE("UUID v4 generates unique values", "[uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto s = Uuid::v4().to_string();
        REQUIRE(seen.find(s) == seen.end());
        seen.insert(s);
    }
}

TEST_CASE("UUID default is nil", "[uuid]") {
    Uuid u;
    REQUIRE(u.is_nil());
    REQUIRE(u == Uuid::nil());
    REQUIRE(u.to_string() == "00000000-0000-0000-0000-000000000000");
    REQUIRE_FALSE(Uuid::v4().is_nil());
}

TEST_CASE("UUID to_string format", "[uuid]") {
    auto u = Uuid::from_bytes(kFields);
    REQUIRE(u.to_string() == "a1a2a3a4-b1b2-c1c2-d1d2-d3d4d5d6d7d8");
    REQUIRE(u.to_string_upper() == "A1A2A3A4-B1B2-C1C2-D1D2-D3D4D5D6D7D8");
    REQUIRE(u.to_hex() == "a1a2a3a4b1b2c1c2d1d2d3d4d5d6d7d8");
}

TEST_CASE("UUID to_string version character", "[uuid]") {
    auto s = Uuid::v4().to_string();
    // Position 14 is the version nibble: must be '4'
    REQUIRE(s[14] == '4');
}

TEST_CASE("UUID from_string roundtrip", "[uuid]") {
    auto u = Uuid::v4();
    auto parsed = Uuid::from_string(u.to_string());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value() == u);
}

TEST_CASE("UUID from_string rejects wrong length", "[uuid]") {
    auto r = Uuid::from_string("too-short");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GuidError::InvalidFormat);
}

TEST_CASE("UUID from_string rejects other UUID spellings", "[uuid]") {
    REQUIRE(Uuid::from_string("a1a2a3a4b1b2c1c2d1d2d3d4d5d6d7d8").is_err());
    REQUIRE(Uuid::from_string("{a1a2a3a4-b1b2-c1c2-d1d2-d3d4d5d6d7d8}").is_err());
    REQUIRE(Uuid::from_string("urn:uuid:a1a2a3a4-b1b2-c1c2-d1d2-d3d4d5d6d7d8").is_err());
}

TEST_CASE("UUID from_string rejects missing dashes", "[uuid]") {
    // Correct length (36 chars) but no dashes
    auto r = Uuid::from_string("550e8400e29b41d4a716446655440000abcd");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GuidError::InvalidFormat);
}

TEST_CASE("UUID from_string rejects extra dashes inside a group", "[uuid]") {
    const char* shifted[] = {
        "00000000-0000-0000-0000---0000000000",
        "00000000---00-0000-0000-000000000000",
        "a1a2a3a4-b1b2-c1c2-d1d2---d3d4d5d6d7",
        "00000000-0000-0000-0000--00000000000",
        "-0000000-0000-0000-0000-000000000000",
        "00000000-0000-0000-0000-00000000000-",
    };
    for (const char* text : shifted) {
        auto r = Uuid::from_string(text);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == GuidError::InvalidFormat);
    }

    auto r = Uuid::from_string("00000000-0000-0000-0000---0000000000");
    REQUIRE(r.error().hint == "Invalid char at position 24");
}

TEST_CASE("UUID from_string stays inside an unterminated buffer", "[uuid]") {
    // Exactly 36 bytes with no terminator after them
    const std::string inputs[] = {
        "00000000-0000-0000-0000--00000000000",
        "00000000-0000-0000-0000-0000000000-0",
        "a1a2a3a4-b1b2-c1c2-d1d2-d3d4d5d6d7d8",
    };
    for (const auto& text : inputs) {
        std::vector<char> buf(text.begin(), text.end());
        REQUIRE(buf.size() == 36);
        auto r = Uuid::from_string(std::string_view(buf.data(), buf.size()));
        if (text[24] == '-' || text[34] == '-') {
            REQUIRE(r.is_err());
        } else {
            REQUIRE(r.is_ok());
            REQUIRE(r.value().bytes == kFields);
        }
    }
}

TEST_CASE("UUID from_string rejects invalid hex", "[uuid]") {
    auto r = Uuid::from_string("550e8400-e29b-41d4-a716-44665544gggg");
    REQUIRE(r.is_err());
    REQUIRE(r.error().hint.find("position 32") != std::string::npos);
}

TEST_CASE("UUID from_string accepts uppercase", "[uuid]") {
    auto parsed = Uuid::from_string("A1A2A3A4-B1B2-C1C2-D1D2-D3D4D5D6D7D8");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().bytes == kFields);
}

TEST_CASE("UUID from_slice requires 16 bytes", "[uuid]") {
    auto ok = Uuid::from_slice(kFields.data(), 16);
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().bytes == kFields);

    auto short_slice = Uuid::from_slice(kFields.data(), 15);
    REQUIRE(short_slice.is_err());
    REQUIRE(short_slice.error().code == GuidError::InvalidSlice);
    REQUIRE(short_slice.error().length == 15);

    REQUIRE(Uuid::from_slice(nullptr, 0).is_err());
}

TEST_CASE("UUID little-endian byte order", "[uuid]") {
    auto u = Uuid::from_bytes(kFields);
    Bytes expected = {
        0xa4, 0xa3, 0xa2, 0xa1,
        0xb2, 0xb1,
        0xc2, 0xc1,
        0xd1, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6, 0xd7, 0xd8,
    };
    REQUIRE(u.to_bytes_le() == expected);
    REQUIRE(Uuid::from_bytes_le(expected) == u);
    REQUIRE(swap_fields(swap_fields(kFields)) == kFields);
}

TEST_CASE("UUID ordering follows network byte order", "[uuid]") {
    auto lo = Uuid::from_string("00000000-0000-0000-0000-0000000000ff").value();
    auto hi = Uuid::from_string("01000000-0000-0000-0000-000000000000").value();
    REQUIRE(lo < hi);
    REQUIRE(lo <= hi);
    REQUIRE(hi > lo);
    REQUIRE(hi >= lo);
    REQUIRE(lo != hi);
}

TEST_CASE("UUID hash depends only on the bytes", "[uuid]") {
    auto a = Uuid::from_bytes(kFields);
    auto b = Uuid::from_string("a1a2a3a4-b1b2-c1c2-d1d2-d3d4d5d6d7d8").value();
    REQUIRE(a.hash() == b.hash());
    REQUIRE(std::hash<Uuid>{}(a) == hash_bytes(kFields));

    std::unordered_set<Uuid> set{a, b, Uuid::nil()};
    REQUIRE(set.size() == 2);
}
