/**
 * @file sanitization_result.hpp
 * @brief Per-file outcomes and the batch report built from them.
 */

#ifndef NICLEAN_SANITIZATION_RESULT_HPP
#define NICLEAN_SANITIZATION_RESULT_HPP

#include "capability.hpp"
#include "media_file.hpp"
#include "naming_engine.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace niclean {

/**
 * @brief What happened to one file.
 */
enum class Outcome {
    CopiedAndStripped,  ///< Copy written and the tool removed its metadata
    CopiedStripSkipped, ///< Copy written unstripped (see Reason)
    Failed,             ///< No output for this file (see Reason)
    SkippedDryRun,      ///< Dry-run: name decided, nothing written
    SkippedUnsupported  ///< Not an image or video; never named
};

/**
 * @brief Why a file was not fully sanitized.
 */
enum class Reason {
    None,
    ToolUnavailable,  ///< The capability for this kind was not resolved
    ToolError,        ///< The tool ran and exited non-zero
    ToolTimeout,      ///< The tool exceeded its time limit and was killed
    UnreadableSource, ///< The source could not be opened for reading
    WriteFailed,      ///< Copying or moving inside the output folder failed
    NotMedia          ///< Classified as Unsupported
};

std::string_view to_string(Outcome outcome) noexcept;
std::string_view to_string(Reason reason) noexcept;

/**
 * @brief Immutable record of one file's trip through the pipeline.
 */
struct SanitizationResult {
    std::filesystem::path source;
    std::filesystem::path destination;       ///< Empty for unsupported files
    MediaKind kind = MediaKind::Unsupported;
    Outcome outcome = Outcome::Failed;
    Reason reason = Reason::None;
    std::string detail;                      ///< Tool message or OS error text
    std::uintmax_t size_before = 0;
    std::uintmax_t size_after = 0;           ///< 0 unless something was written
    std::chrono::milliseconds duration{0};

    /// @return true if a file now exists at destination.
    [[nodiscard]] bool wrote_output() const noexcept {
        return outcome == Outcome::CopiedAndStripped || outcome == Outcome::CopiedStripSkipped;
    }
};

/**
 * @brief Aggregate counts per outcome.
 */
struct BatchCounts {
    std::size_t stripped = 0;
    std::size_t strip_skipped = 0;
    std::size_t failed = 0;
    std::size_t dry_run = 0;
    std::size_t unsupported = 0;

    [[nodiscard]] std::size_t total() const noexcept {
        return stripped + strip_skipped + failed + dry_run + unsupported;
    }
};

/**
 * @brief Everything a front-end needs to present a finished batch.
 *
 * results are in enumeration order, whatever the number of workers.
 */
struct BatchReport {
    std::filesystem::path input_root;
    std::filesystem::path output_root;
    Preset preset = Preset::IPhone;
    bool dry_run = false;
    bool cancelled = false;                  ///< Stopped early; results are partial
    CapabilitySet capabilities;
    std::vector<SanitizationResult> results;
    double seconds = 0.0;

    [[nodiscard]] BatchCounts counts() const noexcept;

    /// @return The result for @p source, or nullptr.
    [[nodiscard]] const SanitizationResult* find(const std::filesystem::path& source) const;
};

} // namespace niclean

#endif // NICLEAN_SANITIZATION_RESULT_HPP
