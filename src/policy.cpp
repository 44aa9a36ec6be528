#include "policy.hpp"
#include <cstdlib>
#include <utility>
#include "errors.hpp"
#include "logger.hpp"

namespace policy {

BoolSetting parse_bool_setting(const std::string& value) {
    if (value == "true")
        return BoolSetting::True;
    if (value == "false")
        return BoolSetting::False;
    return BoolSetting::Unparseable;
}

std::optional<TrustStoreMode> parse_trust_store_mode(const std::string& value) {
    if (value == "ambient")
        return TrustStoreMode::Ambient;
    if (value == "strict")
        return TrustStoreMode::Strict;
    if (value == "skip-if-missing")
        return TrustStoreMode::SkipIfMissing;
    return std::nullopt;
}

const char* to_string(TrustStoreMode mode) {
    switch (mode) {
    case TrustStoreMode::Ambient:
        return "ambient";
    case TrustStoreMode::Strict:
        return "strict";
    case TrustStoreMode::SkipIfMissing:
        return "skip-if-missing";
    }
    return "ambient";
}

std::optional<std::string> branch_short_name(const std::string& ref) {
    const std::string prefix = kBranchPrefix;
    if (ref.size() <= prefix.size() || ref.compare(0, prefix.size(), prefix) != 0)
        return std::nullopt;
    return ref.substr(prefix.size());
}

GitConfigSource::GitConfigSource(fs::path repo) : repo_path_(std::move(repo)) {}

git_config* GitConfigSource::snapshot() const {
    if (snapshot_)
        return snapshot_.get();
    if (!repo_) {
        std::string err;
        repo_ = git::open_repository(repo_path_, &err);
        if (!repo_)
            throw ConfigError("cannot open repository " + repo_path_.string() + ": " + err);
    }
    git_config* raw = nullptr;
    if (git_repository_config_snapshot(&raw, repo_.get()) != 0)
        throw ConfigError("cannot read git config: " + git::last_error_message());
    snapshot_ = git::config_ptr(raw);
    return raw;
}

std::optional<std::string> GitConfigSource::get(const std::string& branch,
                                                const std::string& key) const {
    std::string name = "refgate." + branch + "." + key;
    const char* value = nullptr;
    int rc = git_config_get_string(&value, snapshot(), name.c_str());
    if (rc == GIT_ENOTFOUND)
        return std::nullopt;
    if (rc != 0)
        throw ConfigError("cannot read " + name + ": " + git::last_error_message());
    return std::string(value ? value : "");
}

FileConfigSource::FileConfigSource(BranchSettings branches) : branches_(std::move(branches)) {}

FileConfigSource FileConfigSource::load(const std::string& path) {
    std::map<std::string, std::string> ignored;
    BranchSettings branches;
    std::string err;
    if (!load_config_file(path, ignored, branches, err))
        throw ConfigError("cannot load " + path + ": " + err);
    return FileConfigSource(std::move(branches));
}

std::optional<std::string> FileConfigSource::get(const std::string& branch,
                                                 const std::string& key) const {
    auto br = branches_.find(branch);
    if (br == branches_.end())
        return std::nullopt;
    auto it = br->second.find(key);
    if (it == br->second.end())
        return std::nullopt;
    return it->second;
}

PolicyResolver::PolicyResolver(const ConfigSource& source, TrustStoreMode default_mode)
    : source_(source), default_mode_(default_mode) {}

bool PolicyResolver::read_flag(const std::string& branch, const char* key) const {
    std::string raw = source_.get(branch, key).value_or("false");
    switch (parse_bool_setting(raw)) {
    case BoolSetting::True:
        return true;
    case BoolSetting::False:
        return false;
    case BoolSetting::Unparseable:
        break;
    }
    log_warning("Malformed boolean setting treated as false",
                {{"branch", branch}, {"key", key}, {"value", raw}});
    return false;
}

BranchPolicy PolicyResolver::resolve(const std::string& ref) const {
    BranchPolicy policy;
    policy.trust_store_mode = default_mode_;
    auto branch = branch_short_name(ref);
    if (!branch)
        return policy;
    policy.merge_only = read_flag(*branch, kEnforceMergeOnly);
    policy.auth_only = read_flag(*branch, kEnforceAuthOnly);
    auto path = source_.get(*branch, kAuthTrustStorePath);
    if (path && !path->empty())
        policy.trust_store_path = fs::path(*path);
    auto mode = source_.get(*branch, kAuthTrustStoreMode);
    if (mode && !mode->empty()) {
        if (auto parsed = parse_trust_store_mode(*mode))
            policy.trust_store_mode = *parsed;
        else
            log_warning("Unknown trust store mode, using default",
                        {{"branch", *branch},
                         {"value", *mode},
                         {"default", to_string(default_mode_)}});
    }
    log_debug("Resolved branch policy",
              {{"branch", *branch},
               {"merge_only", policy.merge_only ? "true" : "false"},
               {"auth_only", policy.auth_only ? "true" : "false"},
               {"trust_store", policy.trust_store_path ? policy.trust_store_path->string() : ""},
               {"trust_store_mode", to_string(policy.trust_store_mode)}});
    return policy;
}

static std::optional<fs::path> ambient_trust_store() {
    if (const char* home = std::getenv("GNUPGHOME"); home && *home)
        return fs::path(home);
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".gnupg";
    return std::nullopt;
}

static bool is_directory(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

TrustStoreChoice choose_trust_store(const BranchPolicy& policy) {
    using Status = TrustStoreChoice::Status;
    TrustStoreChoice choice;
    const auto& configured = policy.trust_store_path;
    switch (policy.trust_store_mode) {
    case TrustStoreMode::Strict:
        if (!configured) {
            choice.detail = "no trust store configured";
        } else if (!is_directory(*configured)) {
            choice.detail = "trust store " + configured->string() + " does not exist";
        } else {
            choice.status = Status::Use;
            choice.path = configured;
        }
        return choice;
    case TrustStoreMode::SkipIfMissing:
        if (configured && is_directory(*configured)) {
            choice.status = Status::Use;
            choice.path = configured;
        } else {
            choice.status = Status::Skip;
            choice.detail = configured ? "trust store " + configured->string() + " does not exist"
                                       : "no trust store configured";
        }
        return choice;
    case TrustStoreMode::Ambient:
        break;
    }
    if (configured) {
        if (is_directory(*configured)) {
            choice.status = Status::Use;
            choice.path = configured;
        } else {
            choice.detail = "trust store " + configured->string() + " does not exist";
        }
        return choice;
    }
    auto ambient = ambient_trust_store();
    if (ambient && is_directory(*ambient)) {
        // The child process resolves the same default on its own.
        choice.status = Status::Use;
    } else {
        choice.detail = "no default trust store available";
    }
    return choice;
}

} // namespace policy
