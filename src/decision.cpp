#include "decision.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace policy {

static std::optional<Verdict> check_merge_only(const BranchPolicy& policy,
                                               const CommitFacts& facts) {
    if (!policy.merge_only)
        return std::nullopt;
    if (!facts.parent_count)
        throw InternalError("merge-only check without a parent count");
    if (*facts.parent_count > 1)
        return std::nullopt;
    std::size_t n = *facts.parent_count;
    return Verdict::reject(Violation::MergeOnly,
                           "merge-only policy violated: commit has " + std::to_string(n) +
                               (n == 1 ? " parent" : " parents"));
}

static std::optional<Verdict> check_auth_only(const BranchPolicy& policy,
                                              const CommitFacts& facts) {
    if (!policy.auth_only)
        return std::nullopt;
    if (!facts.verification)
        throw InternalError("auth-only check without a verification verdict");
    if (*facts.verification == git::VerificationVerdict::Good)
        return std::nullopt;
    return Verdict::reject(Violation::AuthOnly,
                           std::string("auth-only policy violated: signature is ") +
                               git::to_string(*facts.verification));
}

Verdict decide(const BranchPolicy& policy, const CommitFacts& facts) {
    if (auto v = check_merge_only(policy, facts))
        return *v;
    if (auto v = check_auth_only(policy, facts))
        return *v;
    return Verdict::accept();
}

// Rejection reasons lead with the ref they refuse.
static Verdict for_ref(Verdict verdict, const RefUpdate& update) {
    if (!verdict.accepted)
        verdict.reason = update.ref_name + ": " + verdict.reason;
    return verdict;
}

Verdict evaluate(const RefUpdate& update, const BranchPolicy& policy,
                 git::CommitInspector& inspector) {
    if (!policy.enforcing())
        return Verdict::accept();
    if (git::is_null_id(update.new_commit)) {
        log_info("Ref deletion introduces no commit", {{"ref", update.ref_name}});
        return Verdict::accept();
    }

    BranchPolicy effective = policy;
    CommitFacts facts;
    if (effective.merge_only) {
        facts.parent_count = inspector.parent_count(update.new_commit);
        if (auto v = check_merge_only(effective, facts))
            return for_ref(*v, update);
    }
    if (effective.auth_only) {
        TrustStoreChoice store = choose_trust_store(effective);
        switch (store.status) {
        case TrustStoreChoice::Status::Missing:
            return for_ref(Verdict::reject(Violation::AuthOnly,
                                           "auth-only policy violated: " + store.detail),
                           update);
        case TrustStoreChoice::Status::Skip:
            log_warning("Signature verification skipped",
                        {{"ref", update.ref_name},
                         {"commit", update.new_commit},
                         {"reason", store.detail},
                         {"trust_store_mode", to_string(effective.trust_store_mode)}});
            effective.auth_only = false;
            break;
        case TrustStoreChoice::Status::Use:
            facts.verification = inspector.verify(update.new_commit, store.path);
            break;
        }
    }
    return for_ref(decide(effective, facts), update);
}

} // namespace policy
