#include <isbnkit/cli.hpp>
#include <isbnkit/isbn.hpp>
#include <isbnkit/report.hpp>
#include <filesystem>
#include <istream>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

namespace isbnkit {

const char* const kUsage =
    "usage: isbncheck [--config FILE] [-v|-q] [ISBN...]\n"
    "  --config FILE  read settings from FILE instead of ./isbnkit.toml\n"
    "  -v, --verbose  log debug messages\n"
    "  -q, --quiet    log errors only\n"
    "  -h, --help     show this message\n";

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.level = log::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.level = log::Error;
        } else if (arg == "--config") {
            if (i + 1 >= args.size()) {
                return IsbnkitError{IsbnkitError::InvalidArg,
                    "--config requires a file argument",
                    "usage: isbncheck --config FILE [ISBN...]"};
            }
            opts.config_path = args[++i];
        } else if (arg == "--") {
            opts.inputs.insert(opts.inputs.end(), args.begin() + i + 1, args.end());
            break;
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            return IsbnkitError{IsbnkitError::InvalidArg,
                "unknown option '" + arg + "'",
                "use '--' before inputs that start with '--'"};
        } else {
            opts.inputs.push_back(arg);
        }
    }
    return Result<Options>::ok(std::move(opts));
}

Result<bool> path_exists(const std::string& path) {
    std::error_code ec;
    bool found = fs::exists(path, ec);
    if (ec) {
        return IsbnkitError{IsbnkitError::IO,
            "cannot access " + path + ": " + ec.message()};
    }
    return Result<bool>::ok(found);
}

Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty()) {
        auto exists = path_exists(global_path);
        ISBNKIT_TRY(exists);
        if (exists.value()) {
            auto r = Config::load(global_path);
            ISBNKIT_TRY(r);
            global = std::move(r).value();
        }
    }

    std::optional<Config> local;
    std::string local_path = opts.config_path.value_or(kLocalConfigFile);
    bool load_local = opts.config_path.has_value();
    if (!load_local) {
        auto exists = path_exists(local_path);
        ISBNKIT_TRY(exists);
        load_local = exists.value();
    }
    if (load_local) {
        log::debug("loading config %s", local_path.c_str());
        auto r = Config::load(local_path);
        ISBNKIT_TRY(r);
        local = std::move(r).value();
    }

    return Result<Config>::ok(Config::effective(global, local));
}

ExitCode check_inputs(const std::vector<std::string>& inputs,
                      const OutputConfig& cfg, std::ostream& out) {
    log::debug("output format: %s", output_format_name(cfg.format));

    Summary summary;
    for (const auto& raw : inputs) {
        auto result = validate(raw);
        summary.record(result);
        out << render(raw, result, cfg) << "\n";

        if (result.is_err()) {
            log::debug("'%s': %s", raw.c_str(), result.error().format().c_str());
            if (cfg.fail_fast) {
                log::warn("stopping at first invalid input");
                break;
            }
        }
    }

    log::info("%zu checked, %zu valid, %zu invalid",
              summary.total, summary.valid, summary.invalid);
    return summary.all_valid() ? ExitValid : ExitInvalid;
}

ExitCode run(const std::vector<std::string>& args, std::istream& in,
             std::ostream& out, std::ostream& err) {
    auto opts = parse_args(args);
    if (opts.is_err()) {
        err << opts.error().format() << "\n";
        return ExitUsage;
    }
    if (opts.value().help) {
        out << kUsage;
        return ExitValid;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        err << cfg.error().format() << "\n";
        return ExitUsage;
    }
    cfg.value().apply_logging();
    if (opts.value().level) {
        log::set_level(*opts.value().level);
    }

    std::vector<std::string> inputs = opts.value().inputs;
    if (inputs.empty()) {
        log::debug("reading ISBNs from stdin");
        inputs = read_inputs(in);
    }
    return check_inputs(inputs, cfg.value().output, out);
}

} // namespace isbnkit
