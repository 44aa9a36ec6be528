#ifndef POLICY_HPP
#define POLICY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include "config_utils.hpp"
#include "git_utils.hpp"

namespace policy {
namespace fs = std::filesystem;

constexpr const char* kBranchPrefix = "refs/heads/";

// Per-branch configuration keys.
constexpr const char* kEnforceMergeOnly = "enforceMergeOnly";
constexpr const char* kEnforceAuthOnly = "enforceAuthOnly";
constexpr const char* kAuthTrustStorePath = "authTrustStorePath";
constexpr const char* kAuthTrustStoreMode = "authTrustStoreMode";

/// Result of reading a configured boolean.
enum class BoolSetting { True, False, Unparseable };

/// Exactly "true" or "false"; everything else is Unparseable.
BoolSetting parse_bool_setting(const std::string& value);

/**
 * @brief What to do when an auth-only branch has no usable trust store.
 *
 * - Ambient: configured path, else the default GnuPG home; reject when the
 *   chosen directory does not exist.
 * - Strict: an explicit, existing trust store is required; reject otherwise.
 * - SkipIfMissing: skip verification when the trust store is missing.
 */
enum class TrustStoreMode { Ambient, Strict, SkipIfMissing };

std::optional<TrustStoreMode> parse_trust_store_mode(const std::string& value);
const char* to_string(TrustStoreMode mode);

/// Effective policy for one ref. Default constructed means "not enforced".
struct BranchPolicy {
    bool merge_only = false;
    bool auth_only = false;
    std::optional<fs::path> trust_store_path;
    TrustStoreMode trust_store_mode = TrustStoreMode::Ambient;

    bool enforcing() const { return merge_only || auth_only; }
};

/// Branch short name of @p ref, or `std::nullopt` outside `refs/heads/`.
std::optional<std::string> branch_short_name(const std::string& ref);

/**
 * @brief Key/value store holding per-branch settings.
 *
 * A missing key yields `std::nullopt`. Failures of the store itself throw
 * ConfigError.
 */
class ConfigSource {
  public:
    virtual ~ConfigSource() = default;
    virtual std::optional<std::string> get(const std::string& branch,
                                           const std::string& key) const = 0;
};

/**
 * @brief Settings from the repository git configuration.
 *
 * Keys live under `refgate.<branch>.<key>`, e.g.
 * `git config refgate.release.enforceMergeOnly true`. The configuration is
 * snapshotted on first access.
 */
class GitConfigSource : public ConfigSource {
  public:
    explicit GitConfigSource(fs::path repo);
    std::optional<std::string> get(const std::string& branch,
                                   const std::string& key) const override;

  private:
    git_config* snapshot() const;

    git::GitInitGuard guard_;
    fs::path repo_path_;
    mutable git::repo_ptr repo_;
    mutable git::config_ptr snapshot_;
};

/// Settings from the `branches` section of a YAML or JSON file.
class FileConfigSource : public ConfigSource {
  public:
    explicit FileConfigSource(BranchSettings branches);

    /// @throws ConfigError when @p path cannot be read or parsed.
    static FileConfigSource load(const std::string& path);

    std::optional<std::string> get(const std::string& branch,
                                   const std::string& key) const override;

  private:
    BranchSettings branches_;
};

/**
 * @brief Turns a ref name into its effective BranchPolicy.
 *
 * Refs outside `refs/heads/` get the default policy without a single
 * configuration lookup.
 */
class PolicyResolver {
  public:
    PolicyResolver(const ConfigSource& source,
                   TrustStoreMode default_mode = TrustStoreMode::Ambient);

    BranchPolicy resolve(const std::string& ref) const;

  private:
    bool read_flag(const std::string& branch, const char* key) const;

    const ConfigSource& source_;
    TrustStoreMode default_mode_;
};

/// Outcome of picking the trust store for one verification.
struct TrustStoreChoice {
    enum class Status {
        Use,    ///< verify against `path` (`std::nullopt` = ambient default)
        Skip,   ///< skip verification, auth check passes
        Missing ///< no usable trust store, fail closed
    };
    Status status = Status::Missing;
    std::optional<fs::path> path;
    std::string detail;
};

/**
 * @brief Apply the branch's TrustStoreMode.
 *
 * The ambient store is `$GNUPGHOME`, else `$HOME/.gnupg`.
 */
TrustStoreChoice choose_trust_store(const BranchPolicy& policy);

} // namespace policy

#endif // POLICY_HPP
