/**
 * @file naming_engine.hpp
 * @brief Device-style destination names, unique within a batch.
 */

#ifndef NICLEAN_NAMING_ENGINE_HPP
#define NICLEAN_NAMING_ENGINE_HPP

#include "media_file.hpp"
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace niclean {

/**
 * @brief A naming convention plus its target containers.
 */
enum class Preset {
    IPhone,  ///< IMG_0001.JPG / VID_0001.MOV
    Android  ///< IMG_20240131_235959.JPG / VID_20240131_235959.MP4
};

/// @return "iphone" or "android".
std::string_view to_string(Preset preset) noexcept;

/// @return The preset named @p name (case-insensitive), or std::nullopt.
std::optional<Preset> parse_preset(std::string_view name);

/**
 * @brief How timestamp names that clash are told apart.
 *
 * With the defaults the second file shot in the same second becomes
 * IMG_20240131_235959_1.JPG, the third _2, and so on.
 */
struct CollisionPolicy {
    std::string separator = "_";
    unsigned first_index = 1;
};

/**
 * @brief Mutable naming state of one batch.
 */
struct NamingState {
    Preset preset = Preset::IPhone;
    std::uint64_t next_image = 1;                ///< Next iPhone image sequence number
    std::uint64_t next_video = 1;                ///< Next iPhone video sequence number
    std::unordered_set<std::string> assigned;    ///< Lowercased names already taken
};

/**
 * @brief Assigns destination file names.
 *
 * @details Counters only move forward: a number is consumed by every
 * assignment, whatever later happens to the file, and a number whose name is
 * already taken (for example by output of an earlier run) is skipped.
 * Timestamp names take the next collision suffix instead. Names are compared
 * case-insensitively so the output folder also works on case-folding
 * filesystems.
 *
 * The engine is pure bookkeeping: it never touches the filesystem. It is
 * not thread-safe; the orchestrator calls it from one thread only.
 */
class NamingEngine {
public:
    explicit NamingEngine(Preset preset, CollisionPolicy policy = {});

    /**
     * @brief Marks @p name as taken without consuming a sequence number.
     */
    void reserve(std::string_view name);

    /**
     * @brief Computes and claims the destination name of @p file.
     * @throws std::invalid_argument if @p file is Unsupported.
     */
    [[nodiscard]] std::string assign(const MediaFile& file);

    [[nodiscard]] const NamingState& state() const noexcept { return state_; }

    /// @return Target container extension, without dot ("JPG", "MOV", "MP4").
    static std::string_view target_extension(Preset preset, MediaKind kind);

    /// @return "IMG" or "VID".
    static std::string_view prefix(MediaKind kind);

    /// @return @p t formatted as local "YYYYMMDD_HHMMSS".
    static std::string format_timestamp(std::time_t t);

private:
    std::string assign_sequential(MediaKind kind);
    std::string assign_timestamped(const MediaFile& file);
    bool claim(const std::string& name);

    NamingState state_;
    CollisionPolicy policy_;
};

} // namespace niclean

#endif // NICLEAN_NAMING_ENGINE_HPP
