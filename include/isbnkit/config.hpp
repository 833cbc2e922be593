#pragma once

#include <isbnkit/result.hpp>
#include <isbnkit/log.hpp>
#include <isbnkit/report.hpp>
#include <string>
#include <optional>

namespace isbnkit {

// [log] section
struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: global > local
// Lower layers override higher layers (local wins over global)
struct Config {
    LogConfig logging;
    OutputConfig output;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool output_format_set = false;
    bool output_show_type_set = false;
    bool output_show_input_set = false;
    bool output_fail_fast_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push the [log] settings into the process-wide logger
    void apply_logging() const;
};

// Discover the global config file path: ~/.isbnkit/config.toml
std::string global_config_path();

// Per-directory config file name
constexpr const char* kLocalConfigFile = "isbnkit.toml";

} // namespace isbnkit
