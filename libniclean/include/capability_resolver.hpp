/**
 * @file capability_resolver.hpp
 * @brief Finds and probes the metadata-stripping tools once per batch.
 */

#ifndef NICLEAN_CAPABILITY_RESOLVER_HPP
#define NICLEAN_CAPABILITY_RESOLVER_HPP

#include "capability.hpp"
#include "tool_locator.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace niclean {

/**
 * @brief Resolves ImageStrip and VideoStrip capabilities.
 *
 * @details The resolver owns an ordered list of locator strategies. For
 * each capability it walks the strategies in order, asks each for its
 * candidates, and probes them with a version command ("exiftool -ver",
 * "ffmpeg -version"). The first candidate whose probe exits 0 wins.
 *
 * resolve() never throws: a tool that cannot be found or does not answer
 * simply leaves the capability unavailable.
 */
class CapabilityResolver {
public:
    static constexpr std::chrono::milliseconds kDefaultProbeTimeout{10'000};

    /**
     * @param locators Lookup strategies, highest priority first.
     * @param probe_timeout Upper bound for each version probe.
     */
    explicit CapabilityResolver(std::vector<std::unique_ptr<IToolLocator>> locators,
                                std::chrono::milliseconds probe_timeout = kDefaultProbeTimeout);

    /**
     * @brief The production lookup order: "tools/" beside the executable, then $PATH.
     */
    static CapabilityResolver with_default_locators();

    /// @return Both capabilities.
    [[nodiscard]] CapabilitySet resolve() const;

    /// @return The resolved state of a single capability.
    [[nodiscard]] Capability resolve(CapabilityKind kind) const;

private:
    /**
     * @brief Runs the identity probe of @p kind against @p candidate.
     * @return The first line of the probe output, or std::nullopt if the probe failed.
     */
    [[nodiscard]] std::optional<std::string> probe(const std::filesystem::path& candidate,
                                                   CapabilityKind kind) const;

    std::vector<std::unique_ptr<IToolLocator>> locators_;
    std::chrono::milliseconds probe_timeout_;
};

} // namespace niclean

#endif // NICLEAN_CAPABILITY_RESOLVER_HPP
