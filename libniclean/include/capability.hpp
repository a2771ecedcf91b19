/**
 * @file capability.hpp
 * @brief External metadata-stripping tools as an explicit, resolved value.
 */

#ifndef NICLEAN_CAPABILITY_HPP
#define NICLEAN_CAPABILITY_HPP

#include "media_file.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace niclean {

/**
 * @brief The two optional tool dependencies of the pipeline.
 */
enum class CapabilityKind {
    ImageStrip, ///< exiftool-compatible metadata eraser
    VideoStrip  ///< ffmpeg-compatible remuxer
};

/**
 * @brief The resolved state of one capability.
 *
 * An unavailable capability is a normal, expected state: the dispatcher
 * copies without stripping and records why.
 */
struct Capability {
    CapabilityKind kind = CapabilityKind::ImageStrip;
    bool available = false;
    std::optional<std::filesystem::path> executable; ///< Set iff available
    std::string version;                             ///< First line of the probe output

    static Capability unavailable(const CapabilityKind kind) {
        return Capability{kind, false, std::nullopt, {}};
    }
};

/**
 * @brief Both capabilities, resolved once per batch and read-only afterwards.
 */
struct CapabilitySet {
    Capability image = Capability::unavailable(CapabilityKind::ImageStrip);
    Capability video = Capability::unavailable(CapabilityKind::VideoStrip);

    /// @return The capability that strips files of @p kind, or nullptr for Unsupported.
    [[nodiscard]] const Capability* for_kind(const MediaKind kind) const noexcept {
        switch (kind) {
            case MediaKind::Image: return &image;
            case MediaKind::Video: return &video;
            case MediaKind::Unsupported: return nullptr;
        }
        return nullptr;
    }
};

/// @return Executable name of the tool backing @p kind ("exiftool" / "ffmpeg").
constexpr std::string_view tool_name(const CapabilityKind kind) noexcept {
    return kind == CapabilityKind::ImageStrip ? "exiftool" : "ffmpeg";
}

} // namespace niclean

#endif // NICLEAN_CAPABILITY_HPP
