#include "system_utils.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>

extern char** environ;

namespace procutil {

static void set_error(std::string* error, const std::string& what) {
    if (error)
        *error = what + ": " + std::strerror(errno);
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        std::string name = entry.substr(0, entry.find('='));
        if (!overrides.count(name))
            env.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides)
        env.push_back(k + "=" + v);
    return env;
}

// Drain both pipes until the child closes them.
static bool read_pipes(UniqueFd& out_fd, UniqueFd& err_fd, std::string& out, std::string& err) {
    char buf[4096];
    while (out_fd || err_fd) {
        pollfd fds[2];
        nfds_t n = 0;
        if (out_fd)
            fds[n++] = pollfd{out_fd.get(), POLLIN, 0};
        if (err_fd)
            fds[n++] = pollfd{err_fd.get(), POLLIN, 0};
        if (poll(fds, n, -1) < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            ssize_t got = read(fds[i].fd, buf, sizeof(buf));
            if (got < 0 && errno == EINTR)
                continue;
            bool is_out = out_fd && fds[i].fd == out_fd.get();
            if (got <= 0) {
                if (is_out)
                    out_fd.reset();
                else
                    err_fd.reset();
                continue;
            }
            (is_out ? out : err).append(buf, static_cast<size_t>(got));
        }
    }
    return true;
}

std::optional<ProcessResult> run_process(const std::vector<std::string>& argv,
                                         const std::map<std::string, std::string>& env_overrides,
                                         std::string* error) {
    if (argv.empty()) {
        if (error)
            *error = "empty command line";
        return std::nullopt;
    }
    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        set_error(error, "pipe");
        return std::nullopt;
    }
    UniqueFd out_read(out_pipe[0]);
    UniqueFd out_write(out_pipe[1]);
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        set_error(error, "pipe");
        return std::nullopt;
    }
    UniqueFd err_read(err_pipe[0]);
    UniqueFd err_write(err_pipe[1]);

    // Everything the child needs is prepared before fork.
    std::vector<std::string> env = build_environment(env_overrides);
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv)
        c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);
    std::vector<char*> c_env;
    c_env.reserve(env.size() + 1);
    for (auto& e : env)
        c_env.push_back(const_cast<char*>(e.c_str()));
    c_env.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        set_error(error, "fork");
        return std::nullopt;
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_write.get(), STDOUT_FILENO);
        dup2(err_write.get(), STDERR_FILENO);
        execvpe(c_argv[0], c_argv.data(), c_env.data());
        const char* msg = "exec failed: ";
        (void)!write(STDERR_FILENO, msg, std::strlen(msg));
        const char* reason = std::strerror(errno);
        (void)!write(STDERR_FILENO, reason, std::strlen(reason));
        _exit(127);
    }
    out_write.reset();
    err_write.reset();

    ProcessResult result;
    bool drained = read_pipes(out_read, err_read, result.out, result.err);
    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        set_error(error, "waitpid");
        return std::nullopt;
    }
    if (!drained) {
        set_error(error, "poll");
        return std::nullopt;
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    return result;
}

} // namespace procutil
