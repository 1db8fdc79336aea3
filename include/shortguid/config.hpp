#pragma once

#include <shortguid/log.hpp>
#include <shortguid/result.hpp>
#include <optional>
#include <string>

namespace shortguid {

// Which representations the CLI prints for an id
enum class OutputFormat {
    All,    // every representation
    Short,  // 22 character form only
    Long    // hyphenated UUID only
};

Result<OutputFormat> parse_output_format(const std::string& s);
const char* output_format_name(OutputFormat f);

struct OutputConfig {
    OutputFormat format = OutputFormat::All;
    bool uppercase = false;  // hyphenated UUIDs in uppercase
};

struct LoggingConfig {
    log::Level level = log::Warn;
    bool color = true;
};

// Layered configuration: global < local
// Later layers override earlier ones, field by field.
struct Config {
    OutputConfig output;
    LoggingConfig logging;
    // Track which fields were explicitly set (for merge)
    bool output_format_set = false;
    bool output_uppercase_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Apply the [log] section to the process-wide logger
    void apply_logging() const;
};

// ~/.shortguid/config.toml, or "" when no home directory is known
std::string global_config_path();

// shortguid.toml in the working directory
std::string local_config_path();

} // namespace shortguid
