#pragma once

#include <shortguid/config.hpp>
#include <shortguid/result.hpp>
#include <shortguid/short_guid.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace shortguid::cli {

enum class Command { Help, Version, Convert, Random };

struct Args {
    Command command = Command::Help;
    std::string input_id;                // convert only
    std::optional<OutputFormat> format;  // from --short / --long

    // `argv` without the program name
    static Result<Args> parse(const std::vector<std::string>& argv);
};

const char* version();
std::string usage(const std::string& program);

// Every representation of `id`, one "label: value" line each
std::string render_all(const ShortGuid& id, bool uppercase);

// Writes the representation chosen by `format` followed by a newline
void print_id(std::ostream& out, const ShortGuid& id, OutputFormat format, bool uppercase);

// Runs a parsed command. Returns the process exit status: 0 on success,
// 1 when the id cannot be parsed.
int run(const Args& args, const Config& cfg, std::ostream& out, std::ostream& err);

} // namespace shortguid::cli
