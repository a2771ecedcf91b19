#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace niclean {

namespace {

    struct FdGuard {
        int fd = -1;
        ~FdGuard() {
            if (fd >= 0) ::close(fd);
        }
    };

    int decode_status(const int status) {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    // returns false once the pipe hit EOF or a hard error
    bool read_available(const int fd, std::string& out) {
        std::array<char, 4096> buf{};
        for (;;) {
            const ssize_t n = ::read(fd, buf.data(), buf.size());
            if (n > 0) {
                const auto room = ProcessRunner::kMaxCapture - std::min(out.size(), ProcessRunner::kMaxCapture);
                out.append(buf.data(), std::min(static_cast<std::size_t>(n), room));
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

} // namespace

ProcessResult ProcessRunner::run(const std::filesystem::path& executable,
                                 const std::vector<std::string>& args,
                                 const std::chrono::milliseconds timeout) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    FdGuard read_end{fds[0]};
    FdGuard write_end{fds[1]};

    // argv must be built before fork: no allocation in the child
    const std::string exe = executable.string();
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(exe.c_str()));
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }
    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(write_end.fd, STDOUT_FILENO);
        ::dup2(write_end.fd, STDERR_FILENO);
        ::execv(exe.c_str(), argv.data());
        ::_exit(127);
    }

    ::close(write_end.fd);
    write_end.fd = -1;
    ::fcntl(read_end.fd, F_SETFL, ::fcntl(read_end.fd, F_GETFL) | O_NONBLOCK);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now()
        + std::clamp(timeout, std::chrono::milliseconds::zero(),
                     std::chrono::duration_cast<std::chrono::milliseconds>(kMaxTimeout));
    bool pipe_open = true;
    int status = 0;

    for (;;) {
        if (pipe_open) {
            pollfd pfd{read_end.fd, POLLIN, 0};
            if (::poll(&pfd, 1, 50) > 0) {
                pipe_open = read_available(read_end.fd, result.output);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            // a grandchild may still hold the pipe open: take what is there and stop
            if (pipe_open) read_available(read_end.fd, result.output);
            result.exit_code = decode_status(status);
            return result;
        }
        if (w < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            Logger::log(LogLevel::Warning,
                        "Timeout after " + std::to_string(timeout.count()) + " ms, killing " + exe, "process");
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            result.timed_out = true;
            result.exit_code = -1;
            return result;
        }
    }
}

} // namespace niclean
