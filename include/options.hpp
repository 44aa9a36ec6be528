#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "logger.hpp"
#include "policy.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool use_syslog = false;
    bool compress_logs = false;
};

struct Options {
    std::filesystem::path repo;
    std::filesystem::path config_file; ///< empty: branch policy comes from git config
    std::string git_executable = "git";
    policy::TrustStoreMode trust_store_mode = policy::TrustStoreMode::Ambient;
    LoggingOptions logging;
    BranchSettings branches; ///< `branches` section of the config file
    std::vector<std::string> positional;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Parse command line arguments, layered over the optional config file.
 *
 * Command line values take precedence over config file values.
 *
 * @throws ConfigError when the config file cannot be loaded or names
 *         unknown options.
 * @throws std::runtime_error for usage errors (unknown flag, bad value, wrong
 *         number of positional arguments).
 */
Options parse_options(int argc, char* argv[]);

/// Repository from `$GIT_DIR`, else the current directory.
std::filesystem::path default_repo();

/// Log file from `$REFGATE_LOG_FILE`, else `refgate.log` inside @p repo.
std::string default_log_file(const std::filesystem::path& repo);

#endif // OPTIONS_HPP
