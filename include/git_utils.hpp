#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <string>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * libgit2 reference-counts init/shutdown, so guards may nest.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    GitHandle(GitHandle&& other) noexcept : h(other.h) { other.h = nullptr; }
    GitHandle& operator=(GitHandle&& other) noexcept {
        if (this != &other) {
            if (h)
                Free(h);
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }
    T* get() const { return h; }
    explicit operator bool() const { return h != nullptr; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using config_ptr = GitHandle<git_config, git_config_free>;

/// The all-zero object id git passes for created and deleted refs.
bool is_null_id(const std::string& id);

/// First seven characters of @p id, for messages.
std::string short_id(const std::string& id);

/**
 * @brief Describe the last libgit2 error.
 *
 * @return Error message or "Unknown libgit2 error".
 */
std::string last_error_message();

/**
 * @brief Open the repository at @p path honouring the git environment.
 *
 * Uses `GIT_REPOSITORY_OPEN_FROM_ENV`, so `GIT_DIR`, `GIT_OBJECT_DIRECTORY`
 * and `GIT_ALTERNATE_OBJECT_DIRECTORIES` set by `git receive-pack` are
 * respected. That is what makes objects still in the push quarantine visible.
 * A set `GIT_DIR` takes precedence over @p path.
 *
 * @param path  Repository (bare or `.git`) directory.
 * @param error Receives the libgit2 message on failure.
 * @return Open repository or an empty handle.
 */
repo_ptr open_repository(const fs::path& path, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
