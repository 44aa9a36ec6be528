#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX file descriptors.
 *
 * Closes the descriptor when the object goes out of scope.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/// Captured outcome of a finished child process.
struct ProcessResult {
    int exit_code = -1; ///< Exit status, or 128 + signal number
    std::string out;
    std::string err;
};

/**
 * @brief Run a program to completion and capture its output.
 *
 * The child inherits the current environment with @p env_overrides applied
 * on top. The override map only shapes the child's environment block; the
 * calling process environment is never modified. `argv[0]` is looked up in
 * `PATH`. Standard input of the child is `/dev/null`.
 *
 * @param argv          Program and arguments; must not be empty.
 * @param env_overrides Variables to set (or replace) for the child.
 * @param error         Optional output receiving the reason for a spawn failure.
 * @return Result on completion or `std::nullopt` if the process could not be
 *         started or waited for.
 */
std::optional<ProcessResult> run_process(const std::vector<std::string>& argv,
                                         const std::map<std::string, std::string>& env_overrides,
                                         std::string* error = nullptr);

/**
 * @brief Build a `NAME=value` environment block from the current environment
 * with @p overrides applied.
 */
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
