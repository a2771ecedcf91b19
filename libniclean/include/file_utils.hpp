#ifndef NICLEAN_FILE_UTILS_HPP
#define NICLEAN_FILE_UTILS_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace niclean {

    /// Prefix of every temporary file the dispatcher creates in the output folder.
    inline constexpr std::string_view kTempPrefix = ".niclean-";

    /// @return Copy of @p s with ASCII letters lowered.
    std::string to_lower(std::string s);

    /// @return Copy of @p s with ASCII letters raised.
    std::string to_upper(std::string s);

    /**
     * @brief Lexical containment test on normalized absolute paths.
     *
     * Does not touch the filesystem, so it also works for paths that do not
     * exist yet (the output root in dry-run mode).
     *
     * @return true if @p path equals @p root or lies below it.
     */
    bool is_within(const std::filesystem::path& root, const std::filesystem::path& path);

    /**
     * @brief Directory holding the running executable.
     *
     * Resolved through /proc/self/exe; falls back to the current directory
     * when that link is unavailable.
     */
    std::filesystem::path executable_directory();

    /**
     * @brief Builds a hidden, unique temporary path inside @p dir.
     *
     * The name ends with @p name_hint so tools that pick a muxer from the
     * extension (ffmpeg) see the destination's container.
     */
    std::filesystem::path make_temp_path_in(const std::filesystem::path& dir,
                                            std::string_view name_hint);

    /// @return true if @p path carries the temporary-file prefix.
    bool is_temp_file(const std::filesystem::path& path);

    /// @return true for OS clutter (.DS_Store, desktop.ini, AppleDouble "._" files).
    bool is_junk_file(const std::filesystem::path& path);

    /**
     * @brief Modification time of a file as a calendar time.
     * @return std::nullopt if the file cannot be stat'ed.
     */
    std::optional<std::time_t> modification_time(const std::filesystem::path& path);

    /**
     * @brief Removes a file, logging (not throwing) on failure.
     * @param path The file to remove; missing files are not an error.
     * @param tag The logger tag.
     */
    void remove_quietly(const std::filesystem::path& path,
                        std::string_view tag = "file_utils");

} // namespace niclean

#endif // NICLEAN_FILE_UTILS_HPP
