#ifndef NICLEAN_ERRORS_HPP
#define NICLEAN_ERRORS_HPP

#include "sanitization_result.hpp"
#include <stdexcept>
#include <string>

namespace niclean {

/**
 * @brief Categories of fatal, pre-processing failures.
 */
enum class SetupErrorKind {
    InputMissing,       ///< Input root absent or not a directory
    OutputInvalid,      ///< Output root unusable (equals input, is a file, cannot be created)
    ToolsMissing        ///< strict_tools set and a capability is unavailable
};

/**
 * @brief Aborts a batch before any file is processed.
 *
 * The only error that escapes BatchOrchestrator::run(); the CLI maps its
 * kind to the process exit code.
 */
class SetupError : public std::runtime_error {
public:
    SetupError(const SetupErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] SetupErrorKind kind() const noexcept { return kind_; }

private:
    SetupErrorKind kind_;
};

/// Process exit statuses of the command line tool.
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitSetup = 2;
inline constexpr int kExitToolsMissing = 3;
inline constexpr int kExitInterrupted = 130;

/// @return The exit status for a batch that failed to start.
[[nodiscard]] constexpr int exit_code_for(const SetupErrorKind kind) noexcept {
    return kind == SetupErrorKind::ToolsMissing ? kExitToolsMissing : kExitSetup;
}

/**
 * @brief A failure confined to one file.
 *
 * Thrown inside the dispatcher and caught at the file boundary, where it
 * becomes a Failed result.
 */
class FileError : public std::runtime_error {
public:
    FileError(const Reason reason, const std::string& what)
        : std::runtime_error(what), reason_(reason) {}

    [[nodiscard]] Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

} // namespace niclean

#endif // NICLEAN_ERRORS_HPP
