#include "process.hpp"
#include "lib.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace Transcode {

namespace {

class Pipe {
public:
    Pipe() {
        if (pipe2(m_fd.data(), O_CLOEXEC) != 0) {
            throw std::runtime_error(fmt::format("Failed to create pipe: {}", std::strerror(errno)));
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

    [[nodiscard]] int Read() const { return m_fd[0]; }
    [[nodiscard]] int Write() const { return m_fd[1]; }

    void CloseRead() {
        if (m_fd[0] >= 0) {
            close(m_fd[0]);
            m_fd[0] = -1;
        }
    }

    void CloseWrite() {
        if (m_fd[1] >= 0) {
            close(m_fd[1]);
            m_fd[1] = -1;
        }
    }

private:
    std::array<int, 2> m_fd{-1, -1};
};

class SpawnActions {
public:
    SpawnActions() { posix_spawn_file_actions_init(&m_actions); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&m_actions); }

    SpawnActions(const SpawnActions &) = delete;
    SpawnActions &operator=(const SpawnActions &) = delete;

    posix_spawn_file_actions_t *Get() { return &m_actions; }

private:
    posix_spawn_file_actions_t m_actions{};
};

std::string Trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

// Reads both pipes until EOF without letting either one fill up.
void Collect(Pipe &out, Pipe &err, ProcessResult &result) {
    std::array<pollfd, 2> fds{pollfd{out.Read(), POLLIN, 0}, pollfd{err.Read(), POLLIN, 0}};
    std::array<std::string *, 2> sinks{&result.Out, &result.Err};
    std::array<char, 4096> buffer{};

    int open = 2;
    while (open > 0) {
        if (poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(fmt::format("Failed to poll child output: {}", std::strerror(errno)));
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open;
            }
        }
    }
}

} // namespace

ProcessResult Run(const std::vector<std::string> &argv) {
    if (argv.empty()) {
        throw std::invalid_argument("Cannot run an empty command");
    }

    Pipe out;
    Pipe err;
    SpawnActions actions;
    posix_spawn_file_actions_addopen(actions.Get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(actions.Get(), out.Write(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(actions.Get(), err.Write(), STDERR_FILENO);

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        cargv.push_back(const_cast<char *>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = -1;
    const int rc = posix_spawnp(&pid, cargv[0], actions.Get(), nullptr, cargv.data(), environ);
    if (rc != 0) {
        throw narratune::TranscodeError(argv[0], 127, fmt::format("failed to start: {}", std::strerror(rc)));
    }
    out.CloseWrite();
    err.CloseWrite();

    ProcessResult result;
    Collect(out, err, result);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(fmt::format("Failed to wait for {}: {}", argv[0], std::strerror(errno)));
        }
    }

    if (WIFEXITED(status)) {
        result.ExitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.ExitCode = 128 + WTERMSIG(status);
    }
    return result;
}

ProcessResult RunChecked(const std::vector<std::string> &argv) {
    auto result = Run(argv);
    if (result.ExitCode != 0) {
        throw narratune::TranscodeError(argv.front(), result.ExitCode, Trim(result.Err));
    }
    return result;
}

} // namespace Transcode
