#include "../../include/capability_resolver.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"
#include <exception>

namespace fs = std::filesystem;

namespace niclean {

CapabilityResolver::CapabilityResolver(std::vector<std::unique_ptr<IToolLocator>> locators,
                                       const std::chrono::milliseconds probe_timeout)
    : locators_(std::move(locators)),
      probe_timeout_(probe_timeout) {}

CapabilityResolver CapabilityResolver::with_default_locators() {
    std::vector<std::unique_ptr<IToolLocator>> locators;
    locators.push_back(std::make_unique<BundledToolLocator>(executable_directory() / "tools"));
    locators.push_back(std::make_unique<SearchPathLocator>(SearchPathLocator::from_environment()));
    return CapabilityResolver(std::move(locators));
}

CapabilitySet CapabilityResolver::resolve() const {
    CapabilitySet set;
    set.image = resolve(CapabilityKind::ImageStrip);
    set.video = resolve(CapabilityKind::VideoStrip);
    return set;
}

Capability CapabilityResolver::resolve(const CapabilityKind kind) const {
    const auto tool = tool_name(kind);

    for (const auto& locator : locators_) {
        for (const auto& candidate : locator->candidates(tool)) {
            if (auto version = probe(candidate, kind)) {
                Logger::log(LogLevel::Info,
                            std::string(tool) + " found (" + std::string(locator->get_name()) + "): "
                            + candidate.string() + (version->empty() ? "" : " [" + *version + "]"),
                            "resolver");
                return Capability{kind, true, candidate, std::move(*version)};
            }
            Logger::log(LogLevel::Debug, "Probe failed for " + candidate.string(), "resolver");
        }
    }

    Logger::log(LogLevel::Warning, std::string(tool) + " not found; "
                + (kind == CapabilityKind::ImageStrip ? "images" : "videos")
                + " will be copied without stripping metadata", "resolver");
    return Capability::unavailable(kind);
}

std::optional<std::string> CapabilityResolver::probe(const fs::path& candidate, const CapabilityKind kind) const {
    const std::vector<std::string> args{kind == CapabilityKind::ImageStrip ? "-ver" : "-version"};
    try {
        auto res = ProcessRunner::run(candidate, args, probe_timeout_);
        if (!res.succeeded()) {
            return std::nullopt;
        }
        const auto eol = res.output.find_first_of("\r\n");
        return res.output.substr(0, eol);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Cannot probe " + candidate.string() + ": " + e.what(), "resolver");
        return std::nullopt;
    }
}

} // namespace niclean
