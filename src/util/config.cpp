#include <isbnkit/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace isbnkit {

static IsbnkitError type_error(const std::string& key, const char* expected) {
    return IsbnkitError{IsbnkitError::Config,
        "config key '" + key + "' must be a " + expected};
}

// Reads an optional bool key; `set` is raised when the key is present.
static Status read_bool(const toml::table& tbl, const std::string& section,
                        const char* key, bool& out, bool& set) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value_exact<bool>();
    if (!v) return type_error(section + "." + key, "boolean");
    out = *v;
    set = true;
    return ok_status();
}

static Status parse_log(const toml::table& tbl, Config& cfg) {
    for (const auto& [key, val] : tbl) {
        std::string k(key);
        if (k != "level" && k != "color") {
            log::warn("ignoring unknown config key 'log.%s'", k.c_str());
        }
    }

    if (auto node = tbl["level"]) {
        auto s = node.value_exact<std::string>();
        if (!s) return type_error("log.level", "string");
        ISBNKIT_TRY(log::parse_level(*s).map([&](log::Level lvl) {
            cfg.logging.level = lvl;
            cfg.log_level_set = true;
            return std::monostate{};
        }));
    }
    return read_bool(tbl, "log", "color", cfg.logging.color, cfg.log_color_set);
}

static Status parse_output(const toml::table& tbl, Config& cfg) {
    for (const auto& [key, val] : tbl) {
        std::string k(key);
        if (k != "format" && k != "show-type" && k != "show-input" &&
            k != "fail-fast") {
            log::warn("ignoring unknown config key 'output.%s'", k.c_str());
        }
    }

    if (auto node = tbl["format"]) {
        auto s = node.value_exact<std::string>();
        if (!s) return type_error("output.format", "string");
        ISBNKIT_TRY(parse_output_format(*s).map([&](OutputFormat fmt) {
            cfg.output.format = fmt;
            cfg.output_format_set = true;
            return std::monostate{};
        }));
    }
    ISBNKIT_TRY(read_bool(tbl, "output", "show-type",
                          cfg.output.show_type, cfg.output_show_type_set));
    ISBNKIT_TRY(read_bool(tbl, "output", "show-input",
                          cfg.output.show_input, cfg.output_show_input_set));
    return read_bool(tbl, "output", "fail-fast",
                     cfg.output.fail_fast, cfg.output_fail_fast_set);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return IsbnkitError{IsbnkitError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto tbl = doc["log"].as_table()) {
        ISBNKIT_TRY(parse_log(*tbl, cfg));
    }

    // [output] section
    if (auto tbl = doc["output"].as_table()) {
        ISBNKIT_TRY(parse_output(*tbl, cfg));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return IsbnkitError{IsbnkitError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Config::parse(ss.str());
    if (r.is_err() && r.error().file.empty()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    if (other.output_format_set) {
        output.format = other.output.format;
        output_format_set = true;
    }
    if (other.output_show_type_set) {
        output.show_type = other.output.show_type;
        output_show_type_set = true;
    }
    if (other.output_show_input_set) {
        output.show_input = other.output.show_input;
        output_show_input_set = true;
    }
    if (other.output_fail_fast_set) {
        output.fail_fast = other.output.fail_fast;
        output_fail_fast_set = true;
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
    // Unset color keeps the isatty() auto-detection
    if (log_color_set) {
        log::set_color_enabled(logging.color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.isbnkit/config.toml";
}

} // namespace isbnkit
