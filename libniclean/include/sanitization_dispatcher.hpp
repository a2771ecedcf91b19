/**
 * @file sanitization_dispatcher.hpp
 * @brief Copies one file into the output folder and strips it with the matching tool.
 */

#ifndef NICLEAN_SANITIZATION_DISPATCHER_HPP
#define NICLEAN_SANITIZATION_DISPATCHER_HPP

#include "capability.hpp"
#include "media_file.hpp"
#include "sanitization_result.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace niclean {

struct DispatcherOptions {
    std::filesystem::path output_root;                   ///< Every write stays inside this folder
    bool dry_run = false;
    bool keep_timestamps = true;                         ///< Give the copy the source's mtime
    std::chrono::milliseconds tool_timeout{300'000};     ///< Per tool invocation
};

/**
 * @brief Produces the sanitized copy of a single file.
 *
 * @details The source is opened read-only and is never a write target.
 * Work happens on a hidden temporary copy inside the output folder:
 * - images: "exiftool -all= -overwrite_original -P <copy>" edits the copy in place;
 * - videos: "ffmpeg ... -map_metadata -1 -map_chapters -1 -c copy" remuxes the copy
 *   into a second temporary named after the destination, so ffmpeg picks
 *   the target container from its extension.
 *
 * A tool that exits non-zero leaves the unstripped copy as the output
 * (CopiedStripSkipped/ToolError). A tool that times out fails the file and
 * leaves nothing behind. Without the capability the source is copied as is
 * (CopiedStripSkipped/ToolUnavailable).
 *
 * sanitize() is const and keeps no per-call state, so pool workers may share
 * one dispatcher.
 */
class SanitizationDispatcher {
public:
    explicit SanitizationDispatcher(DispatcherOptions options);

    /**
     * @brief Sanitizes @p file into @p destination.
     * @param file Classified source file.
     * @param destination Final path; must lie inside the output root.
     * @param capabilities The batch's resolved tools.
     * @return The file's result. Per-file errors are reported here, never thrown.
     */
    [[nodiscard]] SanitizationResult sanitize(const MediaFile& file,
                                              const std::filesystem::path& destination,
                                              const CapabilitySet& capabilities) const;

    [[nodiscard]] const DispatcherOptions& options() const noexcept { return options_; }

private:
    enum class StripStatus { Stripped, ToolFailed };

    struct StripOutcome {
        StripStatus status;
        std::filesystem::path output; ///< File holding the result to commit
        std::string message;          ///< Tool output on failure
    };

    StripOutcome strip_image(const Capability& tool, const std::filesystem::path& work) const;
    StripOutcome strip_video(const Capability& tool, const std::filesystem::path& work,
                             const std::filesystem::path& remuxed) const;

    void guard_write_target(const std::filesystem::path& target) const;
    void copy_source(const std::filesystem::path& source, const std::filesystem::path& target) const;
    void commit(const std::filesystem::path& temp, const std::filesystem::path& destination) const;

    DispatcherOptions options_;
};

} // namespace niclean

#endif // NICLEAN_SANITIZATION_DISPATCHER_HPP
