#include <shortguid/cli.hpp>
#include <shortguid/base64.hpp>
#include <shortguid/log.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shortguid::cli {

const char* version() {
    return "0.8.0";
}

std::string usage(const std::string& program) {
    std::ostringstream ss;
    ss << "A tool for generating different UUID representations\n"
       << "\n"
       << "usage: " << program << " <command> [options]\n"
       << "\n"
       << "commands:\n"
       << "  convert <id> [-s|--short] [-l|--long]\n"
       << "        Convert the id to its short or UUID representation\n"
       << "  random\n"
       << "        Create a random id and print all of its representations\n"
       << "\n"
       << "options:\n"
       << "  -h, --help      Print this help\n"
       << "  -V, --version   Print the version\n";
    return ss.str();
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

static GuidError arg_error(const std::string& msg) {
    return GuidError{GuidError::InvalidArg, msg, "run with --help for usage"};
}

Result<Args> Args::parse(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return arg_error("no command given");
    }

    Args args;
    const std::string& cmd = argv[0];

    if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        args.command = Command::Help;
        return Result<Args>::ok(std::move(args));
    }
    if (cmd == "-V" || cmd == "--version") {
        args.command = Command::Version;
        return Result<Args>::ok(std::move(args));
    }

    if (cmd == "random") {
        if (argv.size() > 1) {
            return arg_error("unexpected argument '" + argv[1] + "' for 'random'");
        }
        args.command = Command::Random;
        return Result<Args>::ok(std::move(args));
    }

    if (cmd != "convert") {
        return arg_error("unknown command '" + cmd + "'");
    }

    args.command = Command::Convert;
    bool have_id = false;
    bool want_short = false;
    bool want_long = false;
    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& a = argv[i];
        if (a == "-s" || a == "--short") {
            want_short = true;
        } else if (a == "-l" || a == "--long") {
            want_long = true;
        } else if (a == "-h" || a == "--help") {
            args.command = Command::Help;
            return Result<Args>::ok(std::move(args));
        } else if (a.size() > 1 && a[0] == '-' && !have_id) {
            // A 22 character id may legitimately start with '-'
            if (a.size() != 22 && a.size() != 36) {
                return arg_error("unknown option '" + a + "'");
            }
            args.input_id = a;
            have_id = true;
        } else if (!have_id) {
            args.input_id = a;
            have_id = true;
        } else {
            return arg_error("unexpected argument '" + a + "'");
        }
    }

    if (!have_id) {
        return arg_error("'convert' requires an <id> argument");
    }
    if (want_short && want_long) {
        return arg_error("--short and --long cannot be used together");
    }
    if (want_short) args.format = OutputFormat::Short;
    if (want_long) args.format = OutputFormat::Long;

    return Result<Args>::ok(std::move(args));
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::string canonical(const Uuid& u, bool uppercase) {
    return uppercase ? u.to_string_upper() : u.to_string();
}

std::string render_all(const ShortGuid& id, bool uppercase) {
    const Bytes& bytes = id.as_bytes();
    std::string b64 = base64::encode(bytes.data(), bytes.size(),
                                     base64::Alphabet::Standard, base64::Padding::Emit);
    std::string hex = id.as_uuid().to_hex();
    ShortGuid le = ShortGuid::from_bytes(id.to_bytes_le());

    std::ostringstream ss;
    ss << "Short UUID:                  " << id << "\n"
       << "Base 64:                     " << b64 << "\n"
       << "UUID:                        " << canonical(id.as_uuid(), uppercase) << "\n"
       << "                             " << (uppercase ? upper(hex) : hex) << "\n"
       << "Short UUID (little endian):  " << le << "\n"
       << "UUID (little endian):        " << canonical(le.as_uuid(), uppercase) << "\n";
    return ss.str();
}

void print_id(std::ostream& out, const ShortGuid& id, OutputFormat format, bool uppercase) {
    switch (format) {
        case OutputFormat::Short:
            out << id << "\n";
            break;
        case OutputFormat::Long:
            out << canonical(id.as_uuid(), uppercase) << "\n";
            break;
        case OutputFormat::All:
            out << render_all(id, uppercase);
            break;
    }
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int run(const Args& args, const Config& cfg, std::ostream& out, std::ostream& err) {
    switch (args.command) {
        case Command::Help:
            out << usage("shortguid-cli");
            return 0;
        case Command::Version:
            out << "shortguid-cli " << version() << "\n";
            return 0;
        case Command::Random: {
            auto id = ShortGuid::new_random();
            log::debug("generated %s", id.debug_string().c_str());
            print_id(out, id, OutputFormat::All, cfg.output.uppercase);
            return 0;
        }
        case Command::Convert: {
            auto id = ShortGuid::try_parse(args.input_id);
            if (id.is_err()) {
                log::error("cannot convert '%s'", args.input_id.c_str());
                err << id.error().format() << "\n";
                return 1;
            }
            log::debug("parsed %s", id.value().debug_string().c_str());
            OutputFormat format = args.format.value_or(cfg.output.format);
            print_id(out, id.value(), format, cfg.output.uppercase);
            return 0;
        }
    }
    return 0;
}

} // namespace shortguid::cli
