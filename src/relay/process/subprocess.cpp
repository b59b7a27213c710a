#include "subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

constexpr const char* kLibraryPathVar = "LD_LIBRARY_PATH";

std::vector<char*> to_c_array(const std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) {
        out.push_back(const_cast<char*>(s.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

// Reads from both pipes until each reports EOF.
std::expected<void, std::string> drain(int out_fd, int err_fd,
                                       std::string& out, std::string& err) {
    pollfd fds[2] = {
        {.fd = out_fd, .events = POLLIN, .revents = 0},
        {.fd = err_fd, .events = POLLIN, .revents = 0},
    };
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;

    while (open_count > 0) {
        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("poll() failed: ") + std::strerror(errno));
        }

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            char buf[4096];
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                return std::unexpected(std::string("read() failed: ") + std::strerror(errno));
            }
            if (n == 0) {
                fds[i].fd = -1;
                open_count--;
                continue;
            }
            sinks[i]->append(buf, static_cast<size_t>(n));
        }
    }
    return {};
}

} // namespace

std::expected<ProcessResult, std::string>
run_process(const std::vector<std::string>& argv, const std::vector<std::string>& env) {
    if (argv.empty()) {
        return std::unexpected("empty command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        close_pair(out_pipe);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(saved));
    }

    // Built before fork so the child only calls async-signal-safe functions.
    auto c_argv = to_c_array(argv);
    auto c_env = to_c_array(env);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execve(c_argv[0], c_argv.data(), c_env.data());

        const char* prefix = "execve failed: ";
        const char* reason = std::strerror(errno);
        (void)!::write(STDERR_FILENO, prefix, std::strlen(prefix));
        (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ProcessResult result;
    auto drained = drain(out_pipe[0], err_pipe[0], result.stdout_data, result.stderr_data);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (!drained) {
        return std::unexpected(drained.error());
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -WTERMSIG(status);
    }

    return result;
}

std::string prepend_search_path(const std::string& dir, const std::string& existing) {
    if (existing.empty()) return dir;
    return dir + ":" + existing;
}

std::vector<std::string> build_environment(const std::string& library_dir) {
    std::vector<std::string> env;
    std::string existing;
    const std::string key = std::string(kLibraryPathVar) + "=";

    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        if (entry.starts_with(key)) {
            existing = entry.substr(key.size());
            continue;
        }
        env.push_back(std::move(entry));
    }

    env.push_back(key + prepend_search_path(library_dir, existing));
    return env;
}
