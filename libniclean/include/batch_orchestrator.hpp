/**
 * @file batch_orchestrator.hpp
 * @brief Runs one batch: resolve tools, walk the input, classify, name, sanitize.
 */

#ifndef NICLEAN_BATCH_ORCHESTRATOR_HPP
#define NICLEAN_BATCH_ORCHESTRATOR_HPP

#include "capability_resolver.hpp"
#include "event_bus.hpp"
#include "file_classifier.hpp"
#include "naming_engine.hpp"
#include "sanitization_result.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace niclean {

/// Output folder name used when none is given.
inline constexpr std::string_view kDefaultOutputFolder = "NiClean_cleaned";

/**
 * @brief Order in which discovered files are processed (and numbered).
 */
enum class WalkOrder {
    Name,         ///< Relative path, byte-wise
    ModifiedTime  ///< Modification time, then lowercase file name
};

/// @return The order named @p name ("name" / "mtime"), or std::nullopt.
std::optional<WalkOrder> parse_walk_order(std::string_view name);

/**
 * @brief Everything that parameterizes one batch.
 */
struct BatchOptions {
    std::filesystem::path input_root;
    std::filesystem::path output_root;     ///< Empty: input_root / kDefaultOutputFolder
    Preset preset = Preset::IPhone;
    bool recursive = false;
    bool dry_run = false;
    bool keep_timestamps = true;
    bool strict_tools = false;             ///< Missing tools become a SetupError
    WalkOrder order = WalkOrder::Name;
    unsigned threads = 1;                  ///< Copy+strip workers; naming stays sequential
    std::chrono::milliseconds tool_timeout{300'000};
    ClassifierOptions classifier;
    CollisionPolicy collision;

    /// @return The absolute, normalized output root.
    [[nodiscard]] std::filesystem::path resolved_output_root() const;
};

/**
 * @brief Batch lifecycle.
 */
enum class BatchState {
    Idle,
    Resolving,
    Enumerating,
    Processing,
    Done
};

/**
 * @brief Drives the whole pipeline for one input folder.
 *
 * @details run() moves Idle -> Resolving -> Enumerating -> Processing -> Done.
 * Only setup problems escape, as SetupError, and only before any file is
 * touched. Each file is classified, named and sanitized in enumeration
 * order; a failing file is recorded and the batch moves on.
 *
 * Names are always assigned on the calling thread. With threads > 1 only
 * the copy+strip step runs on the ThreadPool, each task writing its own
 * result slot, so the report keeps enumeration order.
 *
 * request_stop() only sets an atomic flag, so it is safe from any thread
 * and from a signal handler. Files already being copied finish (or clean
 * up); queued ones are dropped and the report comes back flagged as
 * cancelled. Each run() starts with the flag cleared.
 */
class BatchOrchestrator {
public:
    /**
     * @param resolver Tool lookup, consulted once per run().
     * @param bus Receives progress events.
     */
    BatchOrchestrator(const CapabilityResolver& resolver, EventBus& bus);

    /**
     * @brief Runs a batch.
     * @throws SetupError if the input, the output or (with strict_tools) the tools are unusable.
     */
    BatchReport run(const BatchOptions& options);

    /**
     * @brief Convenience overload taking the core parameters only.
     */
    BatchReport run(const std::filesystem::path& input_root,
                    const std::filesystem::path& output_root,
                    Preset preset,
                    bool recursive,
                    bool dry_run);

    /// @brief Requests cancellation at the next file boundary.
    void request_stop();

    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] BatchState state() const {
        return state_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Lists the files a batch would process, in processing order.
     *
     * Skips junk files and leftover temporaries. When @p output_root lies
     * inside @p input_root its contents are skipped too.
     */
    static std::vector<std::filesystem::path> enumerate(const std::filesystem::path& input_root,
                                                        const std::filesystem::path& output_root,
                                                        bool recursive,
                                                        WalkOrder order);

private:
    void validate(const std::filesystem::path& input_root,
                  const std::filesystem::path& output_root) const;

    void prepare_output(const std::filesystem::path& output_root) const;

    static void reserve_existing(NamingEngine& naming, const std::filesystem::path& output_root);

    const CapabilityResolver& resolver_;
    EventBus& event_bus_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<BatchState> state_{BatchState::Idle};
};

} // namespace niclean

#endif // NICLEAN_BATCH_ORCHESTRATOR_HPP
