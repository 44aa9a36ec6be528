#include "test_common.hpp"

using namespace refgate::test_support;
using git::VerificationVerdict;
using policy::BranchPolicy;
using policy::CommitFacts;
using policy::RefUpdate;
using policy::Violation;

static BranchPolicy merge_only() {
    BranchPolicy p;
    p.merge_only = true;
    return p;
}

static BranchPolicy auth_only(const fs::path& store) {
    BranchPolicy p;
    p.auth_only = true;
    p.trust_store_path = store;
    return p;
}

TEST_CASE("decide rejects merge-only without a merge") {
    for (std::size_t parents : {0u, 1u}) {
        CommitFacts facts;
        facts.parent_count = parents;
        auto v = policy::decide(merge_only(), facts);
        REQUIRE_FALSE(v.accepted);
        REQUIRE(v.violation == Violation::MergeOnly);
        REQUIRE(v.reason.find("merge-only") != std::string::npos);
    }
}

TEST_CASE("decide accepts merge-only with two or more parents") {
    for (std::size_t parents : {2u, 3u, 8u}) {
        CommitFacts facts;
        facts.parent_count = parents;
        REQUIRE(policy::decide(merge_only(), facts).accepted);
    }
}

TEST_CASE("decide accepts auth-only only for a good signature") {
    BranchPolicy p;
    p.auth_only = true;
    CommitFacts facts;
    facts.verification = VerificationVerdict::Good;
    REQUIRE(policy::decide(p, facts).accepted);
    for (auto verdict : {VerificationVerdict::Bad, VerificationVerdict::Unverifiable,
                         VerificationVerdict::NoSignature}) {
        facts.verification = verdict;
        auto v = policy::decide(p, facts);
        REQUIRE_FALSE(v.accepted);
        REQUIRE(v.violation == Violation::AuthOnly);
        REQUIRE(v.reason.find(git::to_string(verdict)) != std::string::npos);
    }
}

TEST_CASE("decide reports merge-only first when both fail") {
    BranchPolicy p;
    p.merge_only = true;
    p.auth_only = true;
    CommitFacts facts;
    facts.parent_count = 1;
    facts.verification = VerificationVerdict::Bad;
    REQUIRE(policy::decide(p, facts).violation == Violation::MergeOnly);
}

TEST_CASE("decide needs the facts its policy checks") {
    BranchPolicy p;
    p.merge_only = true;
    REQUIRE_THROWS_AS(policy::decide(p, CommitFacts{}), InternalError);
    p.merge_only = false;
    p.auth_only = true;
    REQUIRE_THROWS_AS(policy::decide(p, CommitFacts{}), InternalError);
    REQUIRE(policy::decide(BranchPolicy{}, CommitFacts{}).accepted);
}

TEST_CASE("evaluate accepts unconfigured refs without inspecting") {
    FakeInspector inspector;
    RefUpdate update{"refs/heads/feature", kCommitA, kCommitB};
    REQUIRE(policy::evaluate(update, BranchPolicy{}, inspector).accepted);
    REQUIRE(inspector.parent_calls == 0);
    REQUIRE(inspector.verify_calls == 0);
}

TEST_CASE("evaluate scenario A: single parent on merge-only branch") {
    FakeInspector inspector;
    inspector.parents = 1;
    RefUpdate update{"refs/heads/release", kCommitA, kCommitB};
    auto v = policy::evaluate(update, merge_only(), inspector);
    REQUIRE_FALSE(v.accepted);
    REQUIRE(v.violation == Violation::MergeOnly);
    REQUIRE(v.reason == "refs/heads/release: merge-only policy violated: commit has 1 parent");
    REQUIRE(inspector.verify_calls == 0);
}

TEST_CASE("evaluate scenario B: merge commit on merge-only branch") {
    FakeInspector inspector;
    inspector.parents = 2;
    RefUpdate update{"refs/heads/release", kCommitA, kCommitB};
    REQUIRE(policy::evaluate(update, merge_only(), inspector).accepted);
    REQUIRE(inspector.parent_calls == 1);
}

TEST_CASE("evaluate scenarios C and D: signatures on auth-only branch") {
    TempDir store("refgate_decision_store");
    FakeInspector inspector;
    RefUpdate update{"refs/heads/secure", kCommitA, kCommitB};

    inspector.verdict = VerificationVerdict::Bad;
    auto v = policy::evaluate(update, auth_only(store.path), inspector);
    REQUIRE_FALSE(v.accepted);
    REQUIRE(v.violation == Violation::AuthOnly);
    REQUIRE(v.reason == "refs/heads/secure: auth-only policy violated: signature is bad");

    inspector.verdict = VerificationVerdict::Good;
    REQUIRE(policy::evaluate(update, auth_only(store.path), inspector).accepted);
    REQUIRE(inspector.last_trust_store == store.path);
    REQUIRE(inspector.parent_calls == 0);
}

TEST_CASE("evaluate skips verification after a merge-only rejection") {
    TempDir store("refgate_decision_short");
    BranchPolicy p = auth_only(store.path);
    p.merge_only = true;
    FakeInspector inspector;
    inspector.parents = 1;
    inspector.verdict = VerificationVerdict::Good;
    auto v = policy::evaluate({"refs/heads/both", kCommitA, kCommitB}, p, inspector);
    REQUIRE(v.violation == Violation::MergeOnly);
    REQUIRE(inspector.parent_calls == 1);
    REQUIRE(inspector.verify_calls == 0);
}

TEST_CASE("evaluate rejects auth-only when the trust store is missing") {
    fs::path missing = fs::temp_directory_path() / "refgate_no_such_store";
    FS_REMOVE_ALL(missing);
    FakeInspector inspector;
    inspector.verdict = VerificationVerdict::Good;
    auto v = policy::evaluate({"refs/heads/secure", kCommitA, kCommitB}, auth_only(missing),
                              inspector);
    REQUIRE_FALSE(v.accepted);
    REQUIRE(v.violation == Violation::AuthOnly);
    REQUIRE(v.reason.rfind("refs/heads/secure: auth-only", 0) == 0);
    REQUIRE(v.reason.find("does not exist") != std::string::npos);
    REQUIRE(inspector.verify_calls == 0);
}

TEST_CASE("evaluate skip-if-missing passes the auth check") {
    BranchPolicy p = auth_only(fs::temp_directory_path() / "refgate_no_such_store");
    p.trust_store_mode = policy::TrustStoreMode::SkipIfMissing;
    FakeInspector inspector;
    REQUIRE(policy::evaluate({"refs/heads/secure", kCommitA, kCommitB}, p, inspector).accepted);
    REQUIRE(inspector.verify_calls == 0);
}

TEST_CASE("evaluate logs every skipped verification") {
    TempDir dir("refgate_decision_skiplog");
    fs::path log = dir.path / "refgate.log";
    REQUIRE(init_logger(log.string()));
    LoggerGuard guard;
    BranchPolicy p = auth_only(dir.path / "missing");
    p.trust_store_mode = policy::TrustStoreMode::SkipIfMissing;
    FakeInspector inspector;
    RefUpdate update{"refs/heads/secure", kCommitA, kCommitB};
    REQUIRE(policy::evaluate(update, p, inspector).accepted);
    REQUIRE(policy::evaluate(update, p, inspector).accepted);
    shutdown_logger();
    std::string content = read_file(log);
    auto first = content.find("[WARNING] Signature verification skipped");
    REQUIRE(first != std::string::npos);
    REQUIRE(content.find("[WARNING] Signature verification skipped", first + 1) !=
            std::string::npos);
    REQUIRE(content.find("trust_store_mode=skip-if-missing") != std::string::npos);
    REQUIRE(content.find("ref=refs/heads/secure") != std::string::npos);
}

TEST_CASE("evaluate accepts ref deletion") {
    BranchPolicy p = merge_only();
    p.auth_only = true;
    FakeInspector inspector;
    REQUIRE(policy::evaluate({"refs/heads/release", kCommitA, kNullId}, p, inspector).accepted);
    REQUIRE(inspector.parent_calls == 0);
    REQUIRE(inspector.verify_calls == 0);
}

TEST_CASE("evaluate is repeatable") {
    FakeInspector inspector;
    inspector.parents = 1;
    RefUpdate update{"refs/heads/release", kCommitA, kCommitB};
    auto first = policy::evaluate(update, merge_only(), inspector);
    auto second = policy::evaluate(update, merge_only(), inspector);
    REQUIRE(first.accepted == second.accepted);
    REQUIRE(first.reason == second.reason);
}

TEST_CASE("evaluate propagates backend failures") {
    FakeInspector inspector;
    inspector.fail_backend = true;
    RefUpdate update{"refs/heads/release", kCommitA, kCommitB};
    REQUIRE_THROWS_AS(policy::evaluate(update, merge_only(), inspector), BackendError);
}
