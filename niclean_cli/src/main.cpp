#include <atomic>
#include <chrono>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libniclean/include/batch_orchestrator.hpp"
#include "../../libniclean/include/capability_resolver.hpp"
#include "../../libniclean/include/config_loader.hpp"
#include "../../libniclean/include/event_bus.hpp"
#include "../../libniclean/include/events.hpp"
#include "../../libniclean/include/file_utils.hpp"
#include "../../libniclean/include/logger.hpp"
#include "../../libniclean/include/niclean_errors.hpp"

using namespace niclean;
namespace fs = std::filesystem;

namespace {

// simple progress bar printer
void print_progress_bar(const std::size_t done, const std::size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else if (i == pos && done == total) std::cerr << "=";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

std::atomic<bool> interrupted{false};
std::atomic<BatchOrchestrator*> g_orchestrator{nullptr};

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        std::cerr << CYAN
                  << "\n[INTERRUPT] Stop detected. Finishing the current file..."
                  << RESET << std::endl;
        if (auto* orchestrator = g_orchestrator.load()) {
            orchestrator->request_stop();
        }
        interrupted.store(true);
    }
}

void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "main");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Debug, std::string("Locale set to ") + fb, "main");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.", "main");
}

void install_log_sinks(const Settings& settings) {
    Logger::clear_sinks();

    auto console_sink = std::make_unique<ConsoleLogSink>();
    console_sink->log_level = settings.quiet ? std::optional(LogLevel::Error)
                                             : Logger::string_to_level(settings.log_level);
    Logger::add_sink(std::move(console_sink));

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file);
        if (!file_sink->is_open()) {
            Logger::log(LogLevel::Warning, "Cannot open log file " + settings.log_file.string(), "main");
            return;
        }
        Logger::add_sink(std::move(file_sink));
    }
}

// defaults < config file < explicit command line options
BatchOptions build_options(const CLI::App& app, const Settings& settings) {
    BatchOptions options;
    options.input_root = fs::absolute(settings.input_path).lexically_normal();

    std::optional<fs::path> config = settings.config_path.empty()
        ? ConfigLoader::locate({options.input_root, executable_directory()})
        : std::optional(settings.config_path);
    if (config) {
        ConfigLoader::apply(ConfigLoader::load(*config), options);
    }

    apply_cli_overrides(app, settings, options);
    return options;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"niclean: copies photos and videos into a clean folder, stripped of metadata and renamed."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        // prints the error and the usage hint
        (void)app.exit(e);
        return kExitUsage;
    }

    install_log_sinks(settings);
    init_utf8_locale();

    if (settings.gui) {
        Logger::log(LogLevel::Error, "The graphical interface is not part of this build; use the command line options.", "main");
        return kExitUsage;
    }

    const BatchOptions options = build_options(app, settings);

    EventBus bus;
    const CapabilityResolver resolver = CapabilityResolver::with_default_locators();
    BatchOrchestrator orchestrator(resolver, bus);

    // progress tracking
    std::size_t total = 0;
    std::size_t done = 0;
    std::mutex progress_mtx;
    const auto start_total = std::chrono::steady_clock::now();

    bus.subscribe<BatchStartEvent>([&](const BatchStartEvent& e) {
        std::lock_guard lock(progress_mtx);
        total = e.total_files;
    });

    auto on_finish = [&](auto&&) {
        std::lock_guard lock(progress_mtx);
        ++done;
        if (!settings.quiet) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(done, total, elapsed);
        }
    };
    bus.subscribe<FileSanitizedEvent>(on_finish);
    bus.subscribe<FileSkippedEvent>(on_finish);

    bus.subscribe<FileSanitizedEvent>([](const FileSanitizedEvent& e) {
        if (e.result.outcome == Outcome::Failed) {
            Logger::log(LogLevel::Error, e.result.source.filename().string() + ": "
                        + std::string(to_string(e.result.reason)) + " " + e.result.detail, "main");
        }
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    BatchReport report;
    g_orchestrator.store(&orchestrator);
    try {
        report = orchestrator.run(options);
    } catch (const SetupError& e) {
        g_orchestrator.store(nullptr);
        Logger::log(LogLevel::Error, e.what(), "main");
        return exit_code_for(e.kind());
    }
    g_orchestrator.store(nullptr);

    if (!settings.quiet) {
        if (done > 0) std::cerr << "\n";
        print_console_report(report, options.threads);
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(report, settings.report_path)) {
            Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
        }
    }

    if (interrupted.load() || report.cancelled) {
        return kExitInterrupted;
    }
    return kExitOk;
}
