/**
 * @file capture_time_reader.hpp
 * @brief Reads the embedded capture time of a file before it is stripped.
 */

#ifndef NICLEAN_CAPTURE_TIME_READER_HPP
#define NICLEAN_CAPTURE_TIME_READER_HPP

#include "capability.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string_view>

namespace niclean {

/**
 * @brief Asks the image tool for DateTimeOriginal (or CreateDate).
 *
 * exiftool reads both EXIF and QuickTime tags, so the same capability
 * serves images and videos. Without the tool, read() always returns
 * std::nullopt and callers keep the filesystem time.
 */
class CaptureTimeReader {
public:
    CaptureTimeReader(Capability image_tool, std::chrono::milliseconds timeout);

    /**
     * @brief Reads the capture time stored in @p path.
     * @return Local calendar time, or std::nullopt if absent, unreadable or the tool is unavailable.
     */
    [[nodiscard]] std::optional<std::time_t> read(const std::filesystem::path& path) const;

    /**
     * @brief Parses an EXIF-style "YYYY:MM:DD HH:MM:SS" stamp as local time.
     *
     * The all-zero placeholder some cameras write is rejected.
     */
    static std::optional<std::time_t> parse_exif_datetime(std::string_view text);

private:
    Capability image_tool_;
    std::chrono::milliseconds timeout_;
};

} // namespace niclean

#endif // NICLEAN_CAPTURE_TIME_READER_HPP
