#include "test_common.hpp"

using namespace refgate::test_support;
using policy::BoolSetting;
using policy::TrustStoreChoice;
using policy::TrustStoreMode;

TEST_CASE("parse_bool_setting accepts exactly true and false") {
    REQUIRE(policy::parse_bool_setting("true") == BoolSetting::True);
    REQUIRE(policy::parse_bool_setting("false") == BoolSetting::False);
    for (const char* v : {"", "TRUE", "yes", "1", " true", "on"})
        REQUIRE(policy::parse_bool_setting(v) == BoolSetting::Unparseable);
}

TEST_CASE("parse_trust_store_mode") {
    REQUIRE(policy::parse_trust_store_mode("ambient") == TrustStoreMode::Ambient);
    REQUIRE(policy::parse_trust_store_mode("strict") == TrustStoreMode::Strict);
    REQUIRE(policy::parse_trust_store_mode("skip-if-missing") == TrustStoreMode::SkipIfMissing);
    REQUIRE_FALSE(policy::parse_trust_store_mode("lenient"));
    REQUIRE(std::string(policy::to_string(TrustStoreMode::SkipIfMissing)) == "skip-if-missing");
}

TEST_CASE("branch_short_name strips refs/heads/") {
    REQUIRE(policy::branch_short_name("refs/heads/release") == std::string("release"));
    REQUIRE(policy::branch_short_name("refs/heads/team/feature") == std::string("team/feature"));
    REQUIRE_FALSE(policy::branch_short_name("refs/tags/v1.0"));
    REQUIRE_FALSE(policy::branch_short_name("refs/notes/commits"));
    REQUIRE_FALSE(policy::branch_short_name("refs/heads/"));
}

TEST_CASE("PolicyResolver defaults to no enforcement") {
    MapConfigSource source;
    policy::PolicyResolver resolver(source);
    auto p = resolver.resolve("refs/heads/main");
    REQUIRE_FALSE(p.merge_only);
    REQUIRE_FALSE(p.auth_only);
    REQUIRE_FALSE(p.trust_store_path);
    REQUIRE(p.trust_store_mode == TrustStoreMode::Ambient);
    REQUIRE_FALSE(p.enforcing());
}

TEST_CASE("PolicyResolver reads branch settings") {
    MapConfigSource source({{"release", {{"enforceMergeOnly", "true"}}},
                            {"secure",
                             {{"enforceAuthOnly", "true"},
                              {"authTrustStorePath", "/srv/keys"},
                              {"authTrustStoreMode", "strict"}}}});
    policy::PolicyResolver resolver(source, TrustStoreMode::SkipIfMissing);

    auto release = resolver.resolve("refs/heads/release");
    REQUIRE(release.merge_only);
    REQUIRE_FALSE(release.auth_only);
    REQUIRE(release.trust_store_mode == TrustStoreMode::SkipIfMissing);

    auto secure = resolver.resolve("refs/heads/secure");
    REQUIRE_FALSE(secure.merge_only);
    REQUIRE(secure.auth_only);
    REQUIRE(secure.trust_store_path == fs::path("/srv/keys"));
    REQUIRE(secure.trust_store_mode == TrustStoreMode::Strict);
}

TEST_CASE("PolicyResolver treats malformed values as defaults") {
    MapConfigSource source({{"release",
                             {{"enforceMergeOnly", "yes"},
                              {"enforceAuthOnly", "TRUE"},
                              {"authTrustStoreMode", "lenient"}}}});
    policy::PolicyResolver resolver(source, TrustStoreMode::Strict);
    auto p = resolver.resolve("refs/heads/release");
    REQUIRE_FALSE(p.merge_only);
    REQUIRE_FALSE(p.auth_only);
    REQUIRE(p.trust_store_mode == TrustStoreMode::Strict);
}

TEST_CASE("PolicyResolver logs malformed booleans") {
    TempDir dir("refgate_policy_badbool");
    fs::path log = dir.path / "refgate.log";
    REQUIRE(init_logger(log.string()));
    LoggerGuard guard;
    MapConfigSource source({{"release", {{"enforceMergeOnly", "yes"}}}});
    policy::PolicyResolver resolver(source);
    REQUIRE_FALSE(resolver.resolve("refs/heads/release").merge_only);
    shutdown_logger();
    std::string content = read_file(log);
    REQUIRE(content.find("[WARNING] Malformed boolean setting treated as false") !=
            std::string::npos);
    REQUIRE(content.find("branch=release") != std::string::npos);
    REQUIRE(content.find("key=enforceMergeOnly") != std::string::npos);
    REQUIRE(content.find("value=yes") != std::string::npos);
}

TEST_CASE("PolicyResolver does not look up refs outside refs/heads/") {
    MapConfigSource source({{"v1.0", {{"enforceMergeOnly", "true"}}}});
    policy::PolicyResolver resolver(source);
    REQUIRE_FALSE(resolver.resolve("refs/tags/v1.0").enforcing());
    REQUIRE(source.lookups == 0);
}

TEST_CASE("PolicyResolver propagates store failures") {
    UnreachableConfigSource source;
    policy::PolicyResolver resolver(source);
    REQUIRE_THROWS_AS(resolver.resolve("refs/heads/main"), ConfigError);
}

TEST_CASE("FileConfigSource loads branches from YAML") {
    TempDir dir("refgate_policy_yaml");
    fs::path cfg = dir.path / "policy.yaml";
    write_file(cfg, "branches:\n  release:\n    enforceMergeOnly: true\n");
    auto source = policy::FileConfigSource::load(cfg.string());
    REQUIRE(source.get("release", "enforceMergeOnly") == std::string("true"));
    REQUIRE_FALSE(source.get("release", "enforceAuthOnly"));
    REQUIRE_FALSE(source.get("main", "enforceMergeOnly"));
    REQUIRE_THROWS_AS(policy::FileConfigSource::load((dir.path / "missing.yaml").string()),
                      ConfigError);
}

TEST_CASE("choose_trust_store ambient mode") {
    TempDir dir("refgate_trust_ambient");
    policy::BranchPolicy p;
    p.auth_only = true;

    SECTION("configured directory is used") {
        p.trust_store_path = dir.path;
        auto c = policy::choose_trust_store(p);
        REQUIRE(c.status == TrustStoreChoice::Status::Use);
        REQUIRE(c.path == dir.path);
    }
    SECTION("configured but missing directory fails closed") {
        p.trust_store_path = dir.path / "missing";
        REQUIRE(policy::choose_trust_store(p).status == TrustStoreChoice::Status::Missing);
    }
    SECTION("GNUPGHOME is the fallback") {
        EnvGuard env("GNUPGHOME");
        setenv("GNUPGHOME", dir.path.c_str(), 1);
        auto c = policy::choose_trust_store(p);
        REQUIRE(c.status == TrustStoreChoice::Status::Use);
        REQUIRE_FALSE(c.path);
    }
    SECTION("no ambient store fails closed") {
        EnvGuard gnupg("GNUPGHOME");
        EnvGuard home("HOME");
        setenv("GNUPGHOME", (dir.path / "missing").c_str(), 1);
        auto c = policy::choose_trust_store(p);
        REQUIRE(c.status == TrustStoreChoice::Status::Missing);
        REQUIRE_FALSE(c.detail.empty());
    }
}

TEST_CASE("choose_trust_store strict mode needs an explicit directory") {
    TempDir dir("refgate_trust_strict");
    EnvGuard env("GNUPGHOME");
    setenv("GNUPGHOME", dir.path.c_str(), 1);
    policy::BranchPolicy p;
    p.auth_only = true;
    p.trust_store_mode = TrustStoreMode::Strict;
    REQUIRE(policy::choose_trust_store(p).status == TrustStoreChoice::Status::Missing);
    p.trust_store_path = dir.path;
    REQUIRE(policy::choose_trust_store(p).status == TrustStoreChoice::Status::Use);
}

TEST_CASE("choose_trust_store skip-if-missing mode") {
    TempDir dir("refgate_trust_skip");
    policy::BranchPolicy p;
    p.auth_only = true;
    p.trust_store_mode = TrustStoreMode::SkipIfMissing;
    REQUIRE(policy::choose_trust_store(p).status == TrustStoreChoice::Status::Skip);
    p.trust_store_path = dir.path / "missing";
    REQUIRE(policy::choose_trust_store(p).status == TrustStoreChoice::Status::Skip);
    p.trust_store_path = dir.path;
    REQUIRE(policy::choose_trust_store(p).status == TrustStoreChoice::Status::Use);
}
