#include "../../include/naming_engine.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <ctime>
#include <format>
#include <stdexcept>

namespace niclean {

std::string_view to_string(const Preset preset) noexcept {
    return preset == Preset::Android ? "android" : "iphone";
}

std::optional<Preset> parse_preset(const std::string_view name) {
    const auto n = to_lower(std::string(name));
    if (n == "iphone") return Preset::IPhone;
    if (n == "android") return Preset::Android;
    return std::nullopt;
}

NamingEngine::NamingEngine(const Preset preset, CollisionPolicy policy)
    : policy_(std::move(policy)) {
    state_.preset = preset;
}

void NamingEngine::reserve(const std::string_view name) {
    state_.assigned.insert(to_lower(std::string(name)));
}

std::string_view NamingEngine::target_extension(const Preset preset, const MediaKind kind) {
    if (kind == MediaKind::Image) return "JPG";
    return preset == Preset::IPhone ? "MOV" : "MP4";
}

std::string_view NamingEngine::prefix(const MediaKind kind) {
    return kind == MediaKind::Video ? "VID" : "IMG";
}

std::string NamingEngine::format_timestamp(const std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::string NamingEngine::assign(const MediaFile& file) {
    if (!file.is_media()) {
        throw std::invalid_argument("cannot name unsupported file " + file.path.string());
    }
    auto name = state_.preset == Preset::IPhone
                    ? assign_sequential(file.kind)
                    : assign_timestamped(file);
    Logger::log(LogLevel::Debug, file.path.filename().string() + " -> " + name, "naming");
    return name;
}

std::string NamingEngine::assign_sequential(const MediaKind kind) {
    auto& counter = kind == MediaKind::Image ? state_.next_image : state_.next_video;
    const auto ext = target_extension(state_.preset, kind);
    for (;;) {
        // {:04d} widens on its own past 9999
        auto name = std::format("{}_{:04d}.{}", prefix(kind), counter++, ext);
        if (claim(name)) return name;
    }
}

std::string NamingEngine::assign_timestamped(const MediaFile& file) {
    const auto ext = target_extension(state_.preset, file.kind);
    const auto base = std::format("{}_{}", prefix(file.kind), format_timestamp(file.captured_at));

    auto name = std::format("{}.{}", base, ext);
    for (auto i = static_cast<std::uint64_t>(policy_.first_index); !claim(name); ++i) {
        name = std::format("{}{}{}.{}", base, policy_.separator, i, ext);
    }
    return name;
}

bool NamingEngine::claim(const std::string& name) {
    return state_.assigned.insert(to_lower(name)).second;
}

} // namespace niclean
