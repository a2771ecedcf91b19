/**
 * @file media_file.hpp
 * @brief The classified view of one discovered input file.
 */

#ifndef NICLEAN_MEDIA_FILE_HPP
#define NICLEAN_MEDIA_FILE_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string_view>

namespace niclean {

/**
 * @brief What the pipeline does with a file.
 */
enum class MediaKind {
    Image,
    Video,
    Unsupported
};

/**
 * @brief Where a MediaFile's capture timestamp came from.
 */
enum class TimestampSource {
    Embedded,     ///< EXIF DateTimeOriginal / QuickTime CreateDate, read before stripping
    FileModified  ///< Filesystem modification time
};

/**
 * @brief A discovered input file after classification.
 *
 * Built once by FileClassifier and never modified afterwards; the
 * orchestrator passes it by const reference to the naming engine and by
 * value into dispatcher tasks.
 */
struct MediaFile {
    std::filesystem::path path;                        ///< Absolute source path
    MediaKind kind = MediaKind::Unsupported;           ///< Classification
    std::time_t captured_at = 0;                       ///< Best-known capture time (calendar time)
    TimestampSource timestamp_source = TimestampSource::FileModified;
    std::uintmax_t size = 0;                           ///< Source size in bytes (0 if unreadable)

    [[nodiscard]] bool is_media() const noexcept { return kind != MediaKind::Unsupported; }
};

/// @return "image", "video" or "unsupported".
constexpr std::string_view to_string(const MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::Image: return "image";
        case MediaKind::Video: return "video";
        case MediaKind::Unsupported: return "unsupported";
    }
    return "unsupported";
}

} // namespace niclean

#endif // NICLEAN_MEDIA_FILE_HPP
