#include "cli_parser.hpp"
#include "../../../libniclean/include/process_runner.hpp"
#include <CLI/CLI.hpp>
#include <map>

using niclean::Preset;
using niclean::WalkOrder;

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");

    // --- Folders ---
    app.add_option("-i,--input", settings.input_path,
                   "Folder holding the media to clean (default: current folder).");

    app.add_option("-o,--output", settings.output_path,
                   "Folder receiving the cleaned copies (default: <input>/NiClean_cleaned).");

    // --- Naming and walk ---
    app.add_option("--naming", settings.naming, "Naming preset: 'iphone' (default) or 'android'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, Preset>{
                {"iphone", Preset::IPhone},
                {"android", Preset::Android}
            }, CLI::ignore_case));

    app.add_option("--order", settings.order, "Processing order: 'name' (default) or 'mtime'.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, WalkOrder>{
                {"name", WalkOrder::Name},
                {"mtime", WalkOrder::ModifiedTime}
            }, CLI::ignore_case));

    app.add_flag("-r,--include-subfolders", settings.include_subfolders,
                 "Also process files in subfolders.");

    // --- Behaviour ---
    app.add_flag("--dry-run", settings.dry_run,
                 "Show the names that would be produced without writing anything.");

    app.add_flag("--gui", settings.gui,
                 "Start the graphical interface (not available in this build).");

    app.add_flag("--strict-tools", settings.strict_tools,
                 "Refuse to run when exiftool or ffmpeg is missing.");

    app.add_flag("--no-keep-timestamps", settings.no_keep_timestamps,
                 "Do not copy the source modification time onto the cleaned copy.");

    app.add_option("--threads", settings.num_threads,
                   "Files cleaned in parallel (names are always assigned in order).")
        ->check(CLI::PositiveNumber);

    app.add_option("--tool-timeout", settings.tool_timeout_seconds,
                   "Seconds a single exiftool/ffmpeg run may take before it is killed.")
        ->check(CLI::Range(1u, static_cast<unsigned>(niclean::ProcessRunner::kMaxTimeout.count())));

    app.add_option("--config", settings.config_path,
                   "Configuration file (default: niclean.conf in the input folder, then beside the program).")
        ->check(CLI::ExistingFile);

    // --- Output ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
        ->take_last();

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
        ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to a file (default: no file logging).");
}

void apply_cli_overrides(const CLI::App& app, const Settings& settings, niclean::BatchOptions& options) {
    if (app.count("--output") > 0) {
        options.output_root = std::filesystem::absolute(settings.output_path);
    }
    if (app.count("--naming") > 0) {
        options.preset = settings.naming;
    }
    if (app.count("--order") > 0) {
        options.order = settings.order;
    }
    if (settings.include_subfolders) {
        options.recursive = true;
    }
    if (settings.dry_run) {
        options.dry_run = true;
    }
    if (settings.strict_tools) {
        options.strict_tools = true;
    }
    if (settings.no_keep_timestamps) {
        options.keep_timestamps = false;
    }
    if (app.count("--threads") > 0) {
        options.threads = settings.num_threads;
    }
    if (app.count("--tool-timeout") > 0) {
        options.tool_timeout = std::chrono::seconds(settings.tool_timeout_seconds);
    }
}
