// shortguid_cli.cpp
//
// Converts ids between their ShortGuid, UUID and byte representations.
//
//     ./shortguid-cli convert yaZG05xhTLe_ze4lIsj2Mw
//     ./shortguid-cli convert c9a646d3-9c61-4cb7-bfcd-ee2522c8f633 --short
//     ./shortguid-cli random
//
// Defaults for the output format and logging come from
// ~/.shortguid/config.toml and ./shortguid.toml; flags win over both.

#include <shortguid/cli.hpp>
#include <shortguid/config.hpp>
#include <shortguid/log.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace shortguid;

// A missing file is not an error; a broken one is reported and skipped.
static std::optional<Config> load_layer(const std::string& path) {
    if (path.empty()) return std::nullopt;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log::trace("no config at %s", path.c_str());
        return std::nullopt;
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) {
        log::warn("ignoring config: %s", cfg.error().format().c_str());
        return std::nullopt;
    }
    return cfg.value();
}

int main(int argc, char** argv) {
    log::set_program_name("shortguid-cli");

    auto global = load_layer(global_config_path());
    auto local = load_layer(local_config_path());
    Config cfg = Config::effective(global, local);
    cfg.apply_logging();

    std::vector<std::string> rest(argv + 1, argv + argc);
    auto args = cli::Args::parse(rest);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n\n"
                  << cli::usage(argc > 0 ? argv[0] : "shortguid-cli");
        return 2;
    }

    return cli::run(args.value(), cfg, std::cout, std::cerr);
}
