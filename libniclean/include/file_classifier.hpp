/**
 * @file file_classifier.hpp
 * @brief Decides whether a discovered path is an image, a video or neither.
 */

#ifndef NICLEAN_FILE_CLASSIFIER_HPP
#define NICLEAN_FILE_CLASSIFIER_HPP

#include "capture_time_reader.hpp"
#include "media_file.hpp"
#include "mime_detector.hpp"
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace niclean {

/**
 * @brief Allow-lists driving classification.
 *
 * Extensions are stored lowercase with their leading dot.
 */
struct ClassifierOptions {
    std::set<std::string> image_extensions{".jpg", ".jpeg", ".png", ".webp", ".heic", ".heif",
                                           ".tif", ".tiff", ".bmp"};
    std::set<std::string> video_extensions{".mp4", ".mov", ".m4v", ".mkv", ".avi", ".webm"};
    bool sniff_content = true; ///< Consult libmagic for files with an unknown extension

    /**
     * @brief Parses a comma-separated extension list ("jpg, .PNG,heic").
     * @return Normalized extensions; blanks are dropped.
     */
    static std::set<std::string> parse_extension_list(std::string_view csv);
};

/**
 * @brief Builds MediaFile records.
 *
 * @details The extension allow-list decides first. A file whose extension
 * is in neither list is sniffed with libmagic (when enabled) and accepted
 * only if its MIME type is one of the formats the lists describe; anything
 * else is Unsupported.
 *
 * The capture time is the filesystem modification time, upgraded to the
 * embedded capture time when a CaptureTimeReader is supplied (Android
 * naming only). classify() never writes anything.
 */
class FileClassifier {
public:
    explicit FileClassifier(ClassifierOptions options = {},
                            const CaptureTimeReader* time_reader = nullptr);

    /// @return The classified, immutable view of @p path.
    [[nodiscard]] MediaFile classify(const std::filesystem::path& path) const;

    /// @return Classification alone, without size or timestamp lookups.
    [[nodiscard]] MediaKind kind_of(const std::filesystem::path& path) const;

    /// @return The MediaKind a MIME type maps to (Unsupported if not allow-listed).
    static MediaKind kind_from_mime(std::string_view mime);

private:
    ClassifierOptions options_;
    const CaptureTimeReader* time_reader_;
    std::optional<MimeDetector> mime_;
};

} // namespace niclean

#endif // NICLEAN_FILE_CLASSIFIER_HPP
