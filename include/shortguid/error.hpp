#pragma once

#include <cstddef>
#include <string>

namespace shortguid {

struct DecodeError;

struct GuidError {
    enum Code {
        InvalidLength,
        InvalidFormat,
        InvalidSlice,
        Serialization,
        Config,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // Observed character or byte count for InvalidLength / InvalidSlice
    size_t length = 0;

    GuidError() = default;
    GuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    GuidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    GuidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // The three ways parsing an id can fail
    static GuidError invalid_length(size_t len);
    static GuidError invalid_format(const DecodeError& err);
    static GuidError invalid_slice(size_t len);

    // Human-readable sentence, same as `message`
    const std::string& to_string() const { return message; }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace shortguid
