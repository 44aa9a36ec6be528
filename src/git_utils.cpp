#include "git_utils.hpp"
#include <algorithm>

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_null_id(const std::string& id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) { return c == '0'; });
}

std::string short_id(const std::string& id) { return id.substr(0, 7); }

std::string last_error_message() {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return "Unknown libgit2 error";
}

repo_ptr open_repository(const fs::path& path, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, path.string().c_str(), GIT_REPOSITORY_OPEN_FROM_ENV,
                                nullptr) != 0) {
        if (error)
            *error = last_error_message();
        return repo_ptr();
    }
    return repo_ptr(raw);
}

} // namespace git
