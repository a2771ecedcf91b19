#include "../../include/batch_orchestrator.hpp"
#include "../../include/capture_time_reader.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/niclean_errors.hpp"
#include "../../include/sanitization_dispatcher.hpp"
#include <algorithm>
#include <memory>
#include <system_error>
#include <tuple>
#include <unistd.h>

namespace fs = std::filesystem;

namespace niclean {

namespace {

    fs::path absolute_normal(const fs::path& p) {
        std::error_code ec;
        auto abs = fs::absolute(p, ec);
        if (ec) abs = p;
        auto normal = abs.lexically_normal();
        // "dir/" and "dir" name the same folder
        if (!normal.has_filename() && normal.has_relative_path()) {
            normal = normal.parent_path();
        }
        return normal;
    }

    SanitizationResult unsupported_result(const MediaFile& file) {
        SanitizationResult r;
        r.source = file.path;
        r.kind = MediaKind::Unsupported;
        r.outcome = Outcome::SkippedUnsupported;
        r.reason = Reason::NotMedia;
        return r;
    }

    SanitizationResult failed_result(const fs::path& source, const MediaKind kind,
                                     const Reason reason, std::string detail) {
        SanitizationResult r;
        r.source = source;
        r.kind = kind;
        r.outcome = Outcome::Failed;
        r.reason = reason;
        r.detail = std::move(detail);
        return r;
    }

    bool should_skip(const fs::path& path) {
        return is_junk_file(path) || is_temp_file(path);
    }

} // namespace

std::optional<WalkOrder> parse_walk_order(const std::string_view name) {
    const auto lower = to_lower(std::string(name));
    if (lower == "name" || lower == "path") return WalkOrder::Name;
    if (lower == "mtime" || lower == "modified" || lower == "time") return WalkOrder::ModifiedTime;
    return std::nullopt;
}

fs::path BatchOptions::resolved_output_root() const {
    if (output_root.empty()) {
        return absolute_normal(input_root / kDefaultOutputFolder);
    }
    return absolute_normal(output_root);
}

BatchOrchestrator::BatchOrchestrator(const CapabilityResolver& resolver, EventBus& bus)
    : resolver_(resolver), event_bus_(bus) {}

void BatchOrchestrator::request_stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
}

BatchReport BatchOrchestrator::run(const fs::path& input_root,
                                   const fs::path& output_root,
                                   const Preset preset,
                                   const bool recursive,
                                   const bool dry_run) {
    BatchOptions options;
    options.input_root = input_root;
    options.output_root = output_root;
    options.preset = preset;
    options.recursive = recursive;
    options.dry_run = dry_run;
    return run(options);
}

BatchReport BatchOrchestrator::run(const BatchOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    state_.store(BatchState::Idle);
    stop_flag_.store(false, std::memory_order_relaxed);

    const auto input_root = absolute_normal(options.input_root);
    const auto output_root = options.resolved_output_root();
    validate(input_root, output_root);

    state_.store(BatchState::Resolving);
    const CapabilitySet caps = resolver_.resolve();
    event_bus_.publish(CapabilitiesResolvedEvent{caps});
    if (options.strict_tools && (!caps.image.available || !caps.video.available)) {
        throw SetupError(SetupErrorKind::ToolsMissing,
                         "Required tools are missing and strict tool mode is on");
    }

    if (!options.dry_run) {
        prepare_output(output_root);
    }

    state_.store(BatchState::Enumerating);
    const auto files = enumerate(input_root, output_root, options.recursive, options.order);
    Logger::log(LogLevel::Info, "Found " + std::to_string(files.size()) + " file(s) in "
                + input_root.string(), "orchestrator");
    event_bus_.publish(BatchStartEvent{input_root, output_root, files.size(), options.dry_run});

    // embedded capture times only matter for timestamped names
    std::unique_ptr<CaptureTimeReader> time_reader;
    if (options.preset == Preset::Android && caps.image.available) {
        time_reader = std::make_unique<CaptureTimeReader>(caps.image, options.tool_timeout);
    }
    const FileClassifier classifier(options.classifier, time_reader.get());

    NamingEngine naming(options.preset, options.collision);
    reserve_existing(naming, output_root);

    const SanitizationDispatcher dispatcher(DispatcherOptions{
        output_root, options.dry_run, options.keep_timestamps, options.tool_timeout});

    state_.store(BatchState::Processing);

    std::vector<std::optional<SanitizationResult>> slots(files.size());
    std::unique_ptr<ThreadPool> pool;
    if (options.threads > 1 && !options.dry_run) {
        pool = std::make_unique<ThreadPool>(options.threads);
    }

    auto sanitize_into = [&](const std::size_t index, const MediaFile& file, const fs::path& destination) {
        // queued work is dropped once a stop is requested
        if (stop_flag_.load(std::memory_order_relaxed)) return;
        event_bus_.publish(FileSanitizeStartEvent{file.path});
        SanitizationResult r;
        try {
            r = dispatcher.sanitize(file, destination, caps);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Unexpected error on " + file.path.string() + ": " + e.what(),
                        "orchestrator");
            r = failed_result(file.path, file.kind, Reason::WriteFailed, e.what());
        }
        event_bus_.publish(FileSanitizedEvent{r});
        slots[index] = std::move(r);
    };

    for (std::size_t i = 0; i < files.size(); ++i) {
        if (stop_flag_.load(std::memory_order_relaxed)) break;
        const auto& path = files[i];

        MediaFile file;
        std::string name;
        try {
            file = classifier.classify(path);
            if (!file.is_media()) {
                slots[i] = unsupported_result(file);
                event_bus_.publish(FileSkippedEvent{file.path, "Unsupported format"});
                continue;
            }
            name = naming.assign(file);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Cannot classify " + path.string() + ": " + e.what(), "orchestrator");
            slots[i] = failed_result(path, file.kind, Reason::UnreadableSource, e.what());
            continue;
        }
        event_bus_.publish(FileNamedEvent{file.path, name});

        const fs::path destination = output_root / name;
        if (pool) {
            pool->enqueue([&sanitize_into, i, file, destination](std::stop_token) {
                sanitize_into(i, file, destination);
            });
        } else {
            sanitize_into(i, file, destination);
        }
    }

    if (pool) {
        if (stop_flag_.load(std::memory_order_relaxed)) {
            pool->request_stop();
        }
        pool->wait_idle();
        pool.reset();
    }

    BatchReport report;
    report.input_root = input_root;
    report.output_root = output_root;
    report.preset = options.preset;
    report.dry_run = options.dry_run;
    report.cancelled = stop_flag_.load(std::memory_order_relaxed);
    report.capabilities = caps;
    for (auto& slot : slots) {
        if (slot) report.results.push_back(std::move(*slot));
    }
    report.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    state_.store(BatchState::Done);
    if (report.cancelled) {
        Logger::log(LogLevel::Warning, "Batch cancelled after " + std::to_string(report.results.size())
                    + " of " + std::to_string(files.size()) + " file(s)", "orchestrator");
    }
    event_bus_.publish(BatchCompleteEvent{report.counts(), report.cancelled, report.seconds});
    return report;
}

void BatchOrchestrator::validate(const fs::path& input_root, const fs::path& output_root) const {
    std::error_code ec;
    if (!fs::exists(input_root, ec)) {
        throw SetupError(SetupErrorKind::InputMissing, "Input folder does not exist: " + input_root.string());
    }
    if (!fs::is_directory(input_root, ec)) {
        throw SetupError(SetupErrorKind::InputMissing, "Input is not a folder: " + input_root.string());
    }
    if (output_root == input_root) {
        throw SetupError(SetupErrorKind::OutputInvalid, "Output folder must differ from the input folder");
    }
    if (fs::exists(output_root, ec) && !fs::is_directory(output_root, ec)) {
        throw SetupError(SetupErrorKind::OutputInvalid, "Output path is not a folder: " + output_root.string());
    }
}

void BatchOrchestrator::prepare_output(const fs::path& output_root) const {
    std::error_code ec;
    fs::create_directories(output_root, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Failed to create output folder: " + output_root.string()
                    + " (" + ec.message() + ")", "orchestrator");
        throw SetupError(SetupErrorKind::OutputInvalid, "Cannot create output folder: " + output_root.string());
    }
    if (::access(output_root.c_str(), W_OK) != 0) {
        throw SetupError(SetupErrorKind::OutputInvalid, "Output folder is not writable: " + output_root.string());
    }
}

void BatchOrchestrator::reserve_existing(NamingEngine& naming, const fs::path& output_root) {
    std::error_code ec;
    if (!fs::is_directory(output_root, ec)) return;
    for (fs::directory_iterator it(output_root, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (is_temp_file(p)) continue;
        naming.reserve(p.filename().string());
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Could not list output folder: " + ec.message(), "orchestrator");
    }
}

std::vector<fs::path> BatchOrchestrator::enumerate(const fs::path& input_root,
                                                   const fs::path& output_root,
                                                   const bool recursive,
                                                   const WalkOrder order) {
    std::vector<fs::path> files;
    std::error_code ec;

    // an output folder above the input holds the input itself
    const bool output_nested = is_within(input_root, output_root);

    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code fec;
        if (!entry.is_regular_file(fec) || fec) return;
        const auto& p = entry.path();
        if (should_skip(p)) {
            Logger::log(LogLevel::Debug, "Skipping " + p.string(), "orchestrator");
            return;
        }
        if (output_nested && is_within(output_root, p)) return;
        files.push_back(p);
    };

    if (recursive) {
        fs::recursive_directory_iterator it(input_root, fs::directory_options::skip_permission_denied, ec);
        for (const fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code dec;
            if (output_nested && it->is_directory(dec) && is_within(output_root, it->path())) {
                it.disable_recursion_pending();
                continue;
            }
            consider(*it);
        }
    } else {
        for (fs::directory_iterator it(input_root, ec), end; !ec && it != end; it.increment(ec)) {
            consider(*it);
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Error while listing " + input_root.string() + ": " + ec.message(),
                    "orchestrator");
    }

    if (order == WalkOrder::Name) {
        std::sort(files.begin(), files.end(), [&](const fs::path& a, const fs::path& b) {
            return a.lexically_relative(input_root).generic_string()
                 < b.lexically_relative(input_root).generic_string();
        });
    } else {
        struct Keyed {
            std::time_t mtime;
            std::string lower_name;
            fs::path path;
        };
        std::vector<Keyed> keyed;
        keyed.reserve(files.size());
        for (auto& p : files) {
            keyed.push_back({modification_time(p).value_or(0), to_lower(p.filename().string()), std::move(p)});
        }
        std::sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
            return std::tie(a.mtime, a.lower_name, a.path) < std::tie(b.mtime, b.lower_name, b.path);
        });
        files.clear();
        for (auto& k : keyed) files.push_back(std::move(k.path));
    }
    return files;
}

} // namespace niclean
