#ifndef DECISION_HPP
#define DECISION_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include "commit_inspector.hpp"
#include "policy.hpp"

namespace policy {

/// One ref update as handed to the hook by git.
struct RefUpdate {
    std::string ref_name;
    std::string old_commit;
    std::string new_commit;
};

/// Facts gathered about the new commit; only what the policy needs is set.
struct CommitFacts {
    std::optional<std::size_t> parent_count;
    std::optional<git::VerificationVerdict> verification;
};

enum class Violation { None, MergeOnly, AuthOnly };

struct Verdict {
    bool accepted = true;
    Violation violation = Violation::None;
    std::string reason; ///< empty when accepted

    static Verdict accept() { return Verdict{}; }
    static Verdict reject(Violation v, std::string why) { return Verdict{false, v, std::move(why)}; }
};

/**
 * @brief Combine a policy with commit facts.
 *
 * The merge-only check runs before the auth-only check; the first violation
 * is the verdict.
 *
 * @throws InternalError when a fact the policy needs is missing.
 */
Verdict decide(const BranchPolicy& policy, const CommitFacts& facts);

/**
 * @brief Evaluate one update, querying @p inspector only as far as needed.
 *
 * The parent count is fetched only for merge-only branches, the signature
 * only for auth-only branches and only after the merge-only check passed.
 * Deleting a ref introduces no commit and is accepted. A rejection reason
 * starts with the ref name, e.g. `refs/heads/release: merge-only ...`.
 *
 * @throws GateError subclasses from the inspector; never caught here.
 */
Verdict evaluate(const RefUpdate& update, const BranchPolicy& policy,
                 git::CommitInspector& inspector);

} // namespace policy

#endif // DECISION_HPP
