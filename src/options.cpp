#include "options.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include "arg_parser.hpp"
#include "errors.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

static const std::set<std::string> kKnownFlags{
    "--repo",         "--config",        "--git",          "--trust-store-mode",
    "--log-file",     "--log-level",     "--json-log",     "--syslog",
    "--max-log-size", "--max-log-files", "--compress-logs", "--help",
    "--version"};

static const std::set<std::string> kValueFlags{
    "--repo",         "--config",         "--git",      "--trust-store-mode", "--log-file",
    "--log-level",    "--max-log-size",   "--max-log-files"};

static const std::map<char, std::string> kShortFlags{
    {'r', "--repo"},      {'c', "--config"},    {'t', "--trust-store-mode"},
    {'l', "--log-file"},  {'L', "--log-level"}, {'h', "--help"},
    {'V', "--version"}};

fs::path default_repo() {
    const char* dir = std::getenv("GIT_DIR");
    if (dir && *dir)
        return dir;
    return ".";
}

std::string default_log_file(const fs::path& repo) {
    const char* file = std::getenv("REFGATE_LOG_FILE");
    if (file && *file)
        return file;
    return (repo / "refgate.log").string();
}

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, kKnownFlags, kValueFlags, kShortFlags);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;
    std::map<std::string, std::string> cfg_opts;
    if (parser.has_flag("--config")) {
        opts.config_file = parser.get_option("--config");
        if (opts.config_file.empty())
            throw std::runtime_error("--config requires a file");
        std::string err;
        if (!load_config_file(opts.config_file.string(), cfg_opts, opts.branches, err))
            throw ConfigError("Failed to load config " + opts.config_file.string() + ": " + err);
        for (const auto& kv : cfg_opts) {
            if (!kKnownFlags.count(kv.first) || kv.first == "--config")
                throw ConfigError("Unknown option in config: " + kv.first);
        }
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        std::string v = it->second;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v == "" || v == "1" || v == "true" || v == "yes";
    };
    // Command line first, then config file.
    auto value_of = [&](const std::string& k) -> std::optional<std::string> {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        if (it != cfg_opts.end())
            return it->second;
        return std::nullopt;
    };

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.positional = parser.positional();
    if (opts.show_help || opts.print_version)
        return opts;
    if (!opts.positional.empty() && opts.positional.size() != 3)
        throw std::runtime_error("Expected <ref> <old-commit> <new-commit>, got " +
                                 std::to_string(opts.positional.size()) + " arguments");

    auto repo = value_of("--repo");
    opts.repo = repo && !repo->empty() ? fs::path(*repo) : default_repo();
    if (auto git_exe = value_of("--git"); git_exe && !git_exe->empty())
        opts.git_executable = *git_exe;

    if (auto mode = value_of("--trust-store-mode")) {
        auto parsed = policy::parse_trust_store_mode(*mode);
        if (!parsed)
            throw std::runtime_error("Invalid trust store mode: " + *mode);
        opts.trust_store_mode = *parsed;
    }

    auto& logging = opts.logging;
    auto log_file = value_of("--log-file");
    logging.log_file = log_file && !log_file->empty() ? *log_file : default_log_file(opts.repo);
    if (auto level = value_of("--log-level")) {
        bool ok = false;
        logging.log_level = parse_log_level(*level, ok);
        if (!ok)
            throw std::runtime_error("Invalid log level: " + *level);
    }
    if (auto size = value_of("--max-log-size")) {
        bool ok = false;
        logging.max_log_size = parse_bytes(*size, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (auto files = value_of("--max-log-files")) {
        bool ok = false;
        logging.max_log_files = parse_size_t(*files, 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    logging.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    logging.use_syslog = parser.has_flag("--syslog") || cfg_flag("--syslog");
    logging.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
    return opts;
}
