#include <shortguid/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace shortguid {

Result<OutputFormat> parse_output_format(const std::string& s) {
    if (s == "all")   return Result<OutputFormat>::ok(OutputFormat::All);
    if (s == "short") return Result<OutputFormat>::ok(OutputFormat::Short);
    if (s == "long")  return Result<OutputFormat>::ok(OutputFormat::Long);
    return GuidError{GuidError::Config,
        "unknown output format '" + s + "'",
        "expected one of: all, short, long"};
}

const char* output_format_name(OutputFormat f) {
    switch (f) {
        case OutputFormat::All:   return "all";
        case OutputFormat::Short: return "short";
        case OutputFormat::Long:  return "long";
    }
    return "unknown";
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return GuidError{GuidError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [output] section
    if (auto output = doc["output"].as_table()) {
        if (auto v = (*output)["format"].value<std::string>()) {
            auto fmt = parse_output_format(*v);
            SHORTGUID_TRY(fmt);
            cfg.output.format = fmt.value();
            cfg.output_format_set = true;
        }
        if (auto v = (*output)["uppercase"].value<bool>()) {
            cfg.output.uppercase = *v;
            cfg.output_uppercase_set = true;
        }
    }

    // [log] section
    if (auto logging = doc["log"].as_table()) {
        if (auto v = (*logging)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            SHORTGUID_TRY(lvl);
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*logging)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return GuidError{GuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
        return cfg;
    }
    log::debug("loaded config from %s", path.c_str());
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.output_format_set) {
        output.format = other.output.format;
        output_format_set = true;
    }
    if (other.output_uppercase_set) {
        output.uppercase = other.output.uppercase;
        output_uppercase_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(logging.level);
    // Only force colour off; otherwise keep the isatty() decision
    if (!logging.color) {
        log::set_color_enabled(false);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.shortguid/config.toml";
}

std::string local_config_path() {
    return "shortguid.toml";
}

} // namespace shortguid
