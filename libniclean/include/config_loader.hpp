/**
 * @file config_loader.hpp
 * @brief Optional "key = value" configuration files.
 */

#ifndef NICLEAN_CONFIG_LOADER_HPP
#define NICLEAN_CONFIG_LOADER_HPP

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace niclean {

struct BatchOptions;

/// Lowercased key -> raw value, as read from a configuration file.
using ConfigValues = std::map<std::string, std::string>;

/**
 * @brief Finds, reads and applies configuration files.
 *
 * Format: one "key = value" per line; blank lines and lines starting with
 * '#' or ';' are ignored; keys are case-insensitive. Recognized keys:
 * naming, output_folder, include_subfolders, dry_run, keep_timestamps,
 * strict_tools, order, threads, tool_timeout, image_extensions,
 * video_extensions.
 */
class ConfigLoader {
public:
    /// File names looked for, in order, in every search directory.
    static constexpr std::array<std::string_view, 3> kFileNames{
        "niclean.conf", "NiClean.conf", "mediacleaner.conf"
    };

    /**
     * @brief First existing configuration file across @p search_dirs.
     *
     * Directories are searched in order; within a directory kFileNames
     * decides.
     */
    static std::optional<std::filesystem::path> locate(const std::vector<std::filesystem::path>& search_dirs);

    /**
     * @brief Reads @p path.
     * @return The parsed values; empty (with a warning logged) if the file cannot be read.
     */
    static ConfigValues load(const std::filesystem::path& path);

    /// @brief Parses configuration text.
    static ConfigValues parse(std::string_view text);

    /**
     * @brief Overlays @p values onto @p options.
     *
     * output_folder is resolved against options.input_root. Invalid values
     * and unknown keys are logged and skipped.
     *
     * @return Keys that were applied.
     */
    static std::vector<std::string> apply(const ConfigValues& values, BatchOptions& options);

    /// @return true for 1/true/yes/y/on, false for 0/false/no/n/off, std::nullopt otherwise.
    static std::optional<bool> parse_bool(std::string_view value);
};

} // namespace niclean

#endif // NICLEAN_CONFIG_LOADER_HPP
