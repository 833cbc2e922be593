#pragma once

#include <isbnkit/config.hpp>
#include <isbnkit/log.hpp>
#include <isbnkit/result.hpp>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace isbnkit {

// Exit statuses of the isbncheck program
enum ExitCode {
    ExitValid = 0,    // every input validated
    ExitInvalid = 1,  // at least one input was invalid
    ExitUsage = 2     // bad arguments or configuration
};

struct Options {
    std::optional<std::string> config_path;
    std::optional<log::Level> level;
    std::vector<std::string> inputs;
    bool help = false;
};

extern const char* const kUsage;

// Parses isbncheck arguments (without argv[0])
Result<Options> parse_args(const std::vector<std::string>& args);

// Like std::filesystem::exists, but access failures become IO errors
Result<bool> path_exists(const std::string& path);

// Global config, then either --config or ./isbnkit.toml on top
Result<Config> load_config(const Options& opts);

// Validates each input, writing one render() line per input to `out`.
// Stops after the first invalid input when cfg.fail_fast is set.
ExitCode check_inputs(const std::vector<std::string>& inputs,
                      const OutputConfig& cfg, std::ostream& out);

// The whole program: parse args, load config, read `in` when no inputs
// were given, check. Usage and config errors are written to `err`.
ExitCode run(const std::vector<std::string>& args, std::istream& in,
             std::ostream& out, std::ostream& err);

} // namespace isbnkit
