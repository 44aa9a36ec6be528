/**
 * @file refgate.cpp
 * @brief Hook entry point enforcing per-branch push policies.
 *
 * Installed as `hooks/update` it receives `<ref> <old> <new>` on the command
 * line; installed as `hooks/pre-receive` it reads update lines from stdin.
 * Exit status 0 lets git move the ref, anything else refuses the update.
 */

#include <iostream>
#include <memory>

#include "commit_inspector.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "hook.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "policy.hpp"
#include "version.hpp"

static void setup_logging(const LoggingOptions& logging) {
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    if (logging.use_syslog)
        init_syslog();
    init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                logging.max_log_files);
}

/**
 * @brief Application entry point.
 *
 * @return 0 when every update is accepted or when printing help/version;
 *         1 on rejection, usage error or internal error.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const ConfigError& e) {
        // The config file may have named the log file, so use the default one.
        init_logger(default_log_file(default_repo()));
        std::cerr << hook::internal_failure(e.what(), e.kind()).message << std::endl;
        shutdown_logger();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "refgate: " << e.what() << "\n";
        std::cerr << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }
    if (opts.show_help) {
        print_help(argv[0], std::cout);
        return 0;
    }
    if (opts.print_version) {
        std::cout << REFGATE_VERSION << "\n";
        return 0;
    }

    setup_logging(opts.logging);
    hook::Backends backends(
        [&opts]() -> std::unique_ptr<policy::ConfigSource> {
            if (!opts.config_file.empty())
                return std::make_unique<policy::FileConfigSource>(opts.branches);
            return std::make_unique<policy::GitConfigSource>(opts.repo);
        },
        [&opts]() -> std::unique_ptr<git::CommitInspector> {
            return std::make_unique<git::RepositoryInspector>(opts.repo, opts.git_executable);
        });

    int rc = 1;
    try {
        if (opts.positional.size() == 3) {
            policy::RefUpdate update{opts.positional[0], opts.positional[1], opts.positional[2]};
            rc = hook::run_update(update, backends, opts.trust_store_mode, std::cerr);
        } else {
            rc = hook::run_pre_receive(std::cin, backends, opts.trust_store_mode, std::cerr);
        }
    } catch (const std::exception& e) {
        std::cerr << hook::internal_failure(e.what(), "internal").message << std::endl;
        rc = 1;
    }
    shutdown_logger();
    return rc;
}
