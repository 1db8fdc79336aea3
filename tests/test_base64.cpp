#include <catch2/catch.hpp>
#include <shortguid/base64.hpp>
#include <string>
#include <vector>

using namespace shortguid;
using base64::Alphabet;
using base64::Padding;

static std::string enc(const std::string& s, Alphabet a, Padding p) {
    return base64::encode(reinterpret_cast<const uint8_t*>(s.data()), s.size(), a, p);
}

// ===== Encode (RFC 4648 test vectors) =====

TEST_CASE("base64 encode RFC 4648 vectors with padding", "[base64]") {
    REQUIRE(enc("", Alphabet::Standard, Padding::Emit) == "");
    REQUIRE(enc("f", Alphabet::Standard, Padding::Emit) == "Zg==");
    REQUIRE(enc("fo", Alphabet::Standard, Padding::Emit) == "Zm8=");
    REQUIRE(enc("foo", Alphabet::Standard, Padding::Emit) == "Zm9v");
    REQUIRE(enc("foob", Alphabet::Standard, Padding::Emit) == "Zm9vYg==");
    REQUIRE(enc("fooba", Alphabet::Standard, Padding::Emit) == "Zm9vYmE=");
    REQUIRE(enc("foobar", Alphabet::Standard, Padding::Emit) == "Zm9vYmFy");
}

TEST_CASE("base64 encode without padding", "[base64]") {
    REQUIRE(enc("f", Alphabet::UrlSafe, Padding::None) == "Zg");
    REQUIRE(enc("fo", Alphabet::UrlSafe, Padding::None) == "Zm8");
    REQUIRE(enc("foo", Alphabet::UrlSafe, Padding::None) == "Zm9v");
}

TEST_CASE("base64 URL-safe alphabet replaces + and /", "[base64]") {
    std::vector<uint8_t> bytes = {0xfb, 0xff, 0xbf};
    REQUIRE(base64::encode(bytes.data(), bytes.size(), Alphabet::Standard, Padding::None) == "+/+/");
    REQUIRE(base64::encode(bytes.data(), bytes.size(), Alphabet::UrlSafe, Padding::None) == "-_-_");
}

TEST_CASE("base64 encoded_len", "[base64]") {
    REQUIRE(base64::encoded_len(16, Padding::None) == 22);
    REQUIRE(base64::encoded_len(16, Padding::Emit) == 24);
    REQUIRE(base64::encoded_len(0, Padding::None) == 0);
    REQUIRE(base64::encoded_len(3, Padding::Emit) == 4);
}

// ===== Decode =====

TEST_CASE("base64 decode valid input", "[base64]") {
    std::vector<uint8_t> out;
    REQUIRE_FALSE(base64::decode("Zm9vYmFy", Alphabet::Standard, out));
    REQUIRE(std::string(out.begin(), out.end()) == "foobar");

    REQUIRE_FALSE(base64::decode("Zm9vYg", Alphabet::UrlSafe, out));
    REQUIRE(std::string(out.begin(), out.end()) == "foob");

    REQUIRE_FALSE(base64::decode("-_-_", Alphabet::UrlSafe, out));
    REQUIRE(out == std::vector<uint8_t>{0xfb, 0xff, 0xbf});
}

TEST_CASE("base64 decode empty input", "[base64]") {
    std::vector<uint8_t> out = {1, 2, 3};
    REQUIRE_FALSE(base64::decode("", Alphabet::UrlSafe, out));
    REQUIRE(out.empty());
}

TEST_CASE("base64 decode rejects symbols outside the alphabet", "[base64]") {
    std::vector<uint8_t> out;
    auto err = base64::decode("Nothing to see here...", Alphabet::UrlSafe, out);
    REQUIRE(err);
    REQUIRE(err->kind == DecodeError::InvalidByte);
    REQUIRE(err->offset == 7);
    REQUIRE(err->byte == ' ');
    REQUIRE(err->to_string() == "Invalid symbol 32, offset 7.");
}

TEST_CASE("base64 decode alphabets do not mix", "[base64]") {
    std::vector<uint8_t> out;
    auto err = base64::decode("ab+/", Alphabet::UrlSafe, out);
    REQUIRE(err);
    REQUIRE(*err == DecodeError{DecodeError::InvalidByte, 2, '+'});

    err = base64::decode("ab-_", Alphabet::Standard, out);
    REQUIRE(err);
    REQUIRE(*err == DecodeError{DecodeError::InvalidByte, 2, '-'});
}

TEST_CASE("base64 decode rejects trailing padding", "[base64]") {
    std::vector<uint8_t> out;
    auto err = base64::decode("Zg==", Alphabet::Standard, out);
    REQUIRE(err);
    REQUIRE(err->kind == DecodeError::InvalidPadding);
    REQUIRE(err->to_string() == "Invalid padding");
}

TEST_CASE("base64 decode rejects '=' inside the input", "[base64]") {
    std::vector<uint8_t> out;
    auto err = base64::decode("Zg=a", Alphabet::Standard, out);
    REQUIRE(err);
    REQUIRE(*err == DecodeError{DecodeError::InvalidByte, 2, '='});
}

TEST_CASE("base64 decode rejects a dangling symbol", "[base64]") {
    std::vector<uint8_t> out;
    auto err = base64::decode("Zm9vY", Alphabet::UrlSafe, out);
    REQUIRE(err);
    REQUIRE(err->kind == DecodeError::InvalidLength);
    REQUIRE(err->length == 5);
    REQUIRE(err->to_string() == "Invalid input length: 5");
}

TEST_CASE("base64 decode rejects non-zero trailing bits", "[base64]") {
    std::vector<uint8_t> out;
    // "Zg" is the only encoding of "f"; "Zh" sets an unused bit
    auto err = base64::decode("Zh", Alphabet::UrlSafe, out);
    REQUIRE(err);
    REQUIRE(*err == DecodeError{DecodeError::InvalidLastSymbol, 1, 'h'});
    REQUIRE(err->to_string() == "Invalid last symbol 104, offset 1.");
}

TEST_CASE("base64 decode rejects high bytes", "[base64]") {
    std::vector<uint8_t> out;
    std::string input = "AAAA";
    input[1] = static_cast<char>(0xC3);
    auto err = base64::decode(input, Alphabet::UrlSafe, out);
    REQUIRE(err);
    REQUIRE(*err == DecodeError{DecodeError::InvalidByte, 1, 0xC3});
}
