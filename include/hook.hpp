#ifndef HOOK_HPP
#define HOOK_HPP

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include "commit_inspector.hpp"
#include "decision.hpp"
#include "policy.hpp"

namespace hook {

using ConfigFactory = std::function<std::unique_ptr<policy::ConfigSource>()>;
using InspectorFactory = std::function<std::unique_ptr<git::CommitInspector>()>;

/**
 * @brief Lazily constructed collaborators shared by the refs of one run.
 *
 * Nothing is built for refs outside `refs/heads/`. A factory that throws is
 * retried for the next ref, so one failure does not poison the others.
 */
class Backends {
  public:
    Backends(ConfigFactory config, InspectorFactory inspector);

    policy::ConfigSource& config();
    git::CommitInspector& inspector();

  private:
    ConfigFactory make_config_;
    InspectorFactory make_inspector_;
    std::unique_ptr<policy::ConfigSource> config_;
    std::unique_ptr<git::CommitInspector> inspector_;
};

enum class Outcome { Accepted, Rejected, Failed };

struct RefResult {
    Outcome outcome = Outcome::Accepted;
    std::string message;        ///< single line for stderr; empty when accepted
    std::string correlation_id; ///< set when outcome is Failed
};

/// 16 lowercase hex digits identifying one internal failure in the log.
std::string make_correlation_id();

/// Parse one pre-receive line `<old> <new> <ref>`.
std::optional<policy::RefUpdate> parse_update_line(const std::string& line);

/**
 * @brief Evaluate a single ref update end to end.
 *
 * Never throws: rejections and internal errors are folded into the result.
 * Internal errors are logged in full with a correlation id; the message only
 * carries the id.
 */
RefResult check_ref(const policy::RefUpdate& update, Backends& backends,
                    policy::TrustStoreMode default_mode);

/**
 * @brief Log an internal failure and build the user-facing message.
 */
RefResult internal_failure(const std::string& what, const std::string& kind,
                           const std::string& ref = "");

/**
 * @brief update hook mode: one ref from the command line.
 *
 * @return Process exit code, 0 accept, 1 reject or internal error.
 */
int run_update(const policy::RefUpdate& update, Backends& backends,
               policy::TrustStoreMode default_mode, std::ostream& err);

/**
 * @brief pre-receive hook mode: one update per line on @p in.
 *
 * Each ref is evaluated independently and reported on its own line.
 *
 * @return 0 when every ref passed, 1 otherwise.
 */
int run_pre_receive(std::istream& in, Backends& backends, policy::TrustStoreMode default_mode,
                    std::ostream& err);

} // namespace hook

#endif // HOOK_HPP
