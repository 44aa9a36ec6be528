#ifndef COMMIT_INSPECTOR_HPP
#define COMMIT_INSPECTOR_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "git_utils.hpp"

namespace git {

/// Outcome of checking a commit signature against a trust store.
enum class VerificationVerdict {
    Good,         ///< valid signature, trusted key
    Bad,          ///< invalid signature
    Unverifiable, ///< valid signature, key not trusted
    NoSignature
};

const char* to_string(VerificationVerdict v);

/**
 * @brief Map git's one-letter `%G?` status onto a verdict.
 *
 * @throws CorruptDataError for anything but `G`, `B`, `U` or `N`.
 */
VerificationVerdict parse_verification_code(const std::string& code);

/**
 * @brief Read-only facts about a single commit.
 *
 * Implementations throw BackendError when the backend cannot be queried and
 * CorruptDataError when it answers with something that is not a commit.
 */
class CommitInspector {
  public:
    virtual ~CommitInspector() = default;

    /// Number of parent edges of @p commit. A merge has more than one.
    virtual std::size_t parent_count(const std::string& commit) = 0;

    /**
     * @brief Verify the signature of @p commit.
     *
     * @param trust_store GnuPG home to verify against; `std::nullopt` uses the
     *                    ambient default store. Verification always runs.
     */
    virtual VerificationVerdict verify(const std::string& commit,
                                       const std::optional<fs::path>& trust_store) = 0;
};

/**
 * @brief CommitInspector backed by a repository on disk.
 *
 * Commit records are read through libgit2. Signatures are checked by running
 * `git log -1 --format=%G?`, with `GNUPGHOME` passed to that child only.
 * The repository is opened on first use.
 */
class RepositoryInspector : public CommitInspector {
  public:
    explicit RepositoryInspector(fs::path repo, std::string git_executable = "git");

    std::size_t parent_count(const std::string& commit) override;
    VerificationVerdict verify(const std::string& commit,
                               const std::optional<fs::path>& trust_store) override;

  private:
    git_repository* repository();

    GitInitGuard guard_;
    fs::path repo_path_;
    std::string git_;
    repo_ptr repo_;
};

} // namespace git

#endif // COMMIT_INSPECTOR_HPP
