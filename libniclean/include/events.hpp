#ifndef NICLEAN_EVENTS_HPP
#define NICLEAN_EVENTS_HPP

#include "capability.hpp"
#include "sanitization_result.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace niclean {

/**
 * @brief Events BatchOrchestrator publishes on the EventBus.
 *
 * Plain data carriers. FileSanitizeStartEvent and FileSanitizedEvent may be
 * published from pool workers; the others come from the orchestrating
 * thread.
 */

/// Capabilities are known (Resolving -> Enumerating).
struct CapabilitiesResolvedEvent {
    CapabilitySet capabilities;
};

/// Enumeration finished; processing is about to start.
struct BatchStartEvent {
    std::filesystem::path input_root;
    std::filesystem::path output_root;
    std::size_t total_files = 0; ///< Files found, including unsupported ones
    bool dry_run = false;
};

/// A file was classified as Unsupported and will not be named.
struct FileSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

/// A destination name was assigned.
struct FileNamedEvent {
    std::filesystem::path path;
    std::string destination_name;
};

/// Copy+strip of a file begins.
struct FileSanitizeStartEvent {
    std::filesystem::path path;
};

/// Copy+strip of a file finished, whatever the outcome.
struct FileSanitizedEvent {
    SanitizationResult result;
};

/// The batch reached Done.
struct BatchCompleteEvent {
    BatchCounts counts;
    bool cancelled = false;
    double seconds = 0.0;
};

} // namespace niclean

#endif // NICLEAN_EVENTS_HPP
