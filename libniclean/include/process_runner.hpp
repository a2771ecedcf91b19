/**
 * @file process_runner.hpp
 * @brief Runs external tools with an argument vector and a hard deadline.
 */

#ifndef NICLEAN_PROCESS_RUNNER_HPP
#define NICLEAN_PROCESS_RUNNER_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace niclean {

/**
 * @brief Outcome of one external tool invocation.
 */
struct ProcessResult {
    int exit_code = -1;    ///< Exit status, 128+signal if killed by a signal, -1 if timed out
    bool timed_out = false;
    std::string output;    ///< Captured stdout and stderr, interleaved, truncated to kMaxCapture

    [[nodiscard]] bool succeeded() const noexcept { return !timed_out && exit_code == 0; }
};

/**
 * @brief Spawns a process (fork/execv), captures its output and enforces a timeout.
 *
 * The executable is never looked up on PATH; callers pass the path the
 * CapabilityResolver resolved. stdin is connected to /dev/null. A process
 * that outlives the timeout is killed with SIGKILL and reaped.
 */
class ProcessRunner {
public:
    /// Output beyond this many bytes is drained but not kept.
    static constexpr std::size_t kMaxCapture = 64 * 1024;

    /// Longer timeouts are cut down to this.
    static constexpr std::chrono::seconds kMaxTimeout{24 * 60 * 60};

    /**
     * @brief Run @p executable with @p args and wait for it.
     * @param executable Absolute path of the program.
     * @param args Arguments, not including argv[0].
     * @param timeout Upper bound on the wall-clock run time.
     * @return Exit status and captured output. An exec failure shows up as exit code 127.
     * @throws std::system_error if the pipe or the child process cannot be created.
     */
    static ProcessResult run(const std::filesystem::path& executable,
                             const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout);
};

} // namespace niclean

#endif // NICLEAN_PROCESS_RUNNER_HPP
