#include "../../include/file_classifier.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace niclean {

namespace {

    constexpr std::array<std::string_view, 8> kImageMimes{
        "image/jpeg", "image/png", "image/webp", "image/heic", "image/heif",
        "image/tiff", "image/bmp", "image/x-ms-bmp"
    };

    constexpr std::array<std::string_view, 7> kVideoMimes{
        "video/mp4", "video/quicktime", "video/x-m4v", "video/x-matroska",
        "video/x-msvideo", "video/webm", "video/avi"
    };

} // namespace

std::set<std::string> ClassifierOptions::parse_extension_list(const std::string_view csv) {
    std::set<std::string> out;
    std::stringstream ss{std::string(csv)};
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        const auto last = item.find_last_not_of(" \t");
        item = to_lower(item.substr(first, last - first + 1));
        if (item == ".") continue;
        if (item.front() != '.') item.insert(item.begin(), '.');
        out.insert(item);
    }
    return out;
}

FileClassifier::FileClassifier(ClassifierOptions options, const CaptureTimeReader* time_reader)
    : options_(std::move(options)),
      time_reader_(time_reader) {
    if (options_.sniff_content) {
        mime_.emplace();
    }
}

MediaKind FileClassifier::kind_from_mime(const std::string_view mime) {
    for (const auto m : kImageMimes) {
        if (m == mime) return MediaKind::Image;
    }
    for (const auto m : kVideoMimes) {
        if (m == mime) return MediaKind::Video;
    }
    return MediaKind::Unsupported;
}

MediaKind FileClassifier::kind_of(const fs::path& path) const {
    const auto ext = to_lower(path.extension().string());
    if (options_.image_extensions.contains(ext)) return MediaKind::Image;
    if (options_.video_extensions.contains(ext)) return MediaKind::Video;

    if (mime_ && mime_->is_ready()) {
        const auto mime = mime_->detect(path);
        const auto kind = kind_from_mime(mime);
        if (kind != MediaKind::Unsupported) {
            Logger::log(LogLevel::Debug, path.filename().string() + " classified by content as " + mime, "classifier");
        }
        return kind;
    }
    return MediaKind::Unsupported;
}

MediaFile FileClassifier::classify(const fs::path& path) const {
    MediaFile file;
    std::error_code ec;
    file.path = fs::absolute(path, ec);
    if (ec) file.path = path;

    file.kind = kind_of(file.path);
    if (!file.is_media()) {
        Logger::log(LogLevel::Debug, "Unsupported: " + file.path.string(), "classifier");
        return file;
    }

    const auto size = fs::file_size(file.path, ec);
    file.size = ec ? 0 : size;

    file.captured_at = modification_time(file.path).value_or(0);
    file.timestamp_source = TimestampSource::FileModified;
    if (time_reader_) {
        if (const auto embedded = time_reader_->read(file.path)) {
            file.captured_at = *embedded;
            file.timestamp_source = TimestampSource::Embedded;
        }
    }
    return file;
}

} // namespace niclean
