#ifndef NICLEAN_CLI_PARSER_HPP
#define NICLEAN_CLI_PARSER_HPP

#include "../../../libniclean/include/batch_orchestrator.hpp"
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path input_path = ".";
    std::filesystem::path output_path;
    niclean::Preset naming = niclean::Preset::IPhone;
    niclean::WalkOrder order = niclean::WalkOrder::Name;

    bool include_subfolders = false;
    bool dry_run = false;
    bool gui = false;
    bool strict_tools = false;
    bool no_keep_timestamps = false;
    bool quiet = false;

    unsigned num_threads = 1;
    unsigned tool_timeout_seconds = 300;
    std::string log_level = "WARNING";
    std::filesystem::path config_path;
    std::filesystem::path report_path;
    std::filesystem::path log_file;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/**
 * @brief Copies the options the user actually typed into @p options.
 *
 * Options left at their default do not override values that came from a
 * configuration file. --output is taken relative to the working directory.
 */
void apply_cli_overrides(const CLI::App& app, const Settings& settings, niclean::BatchOptions& options);

#endif // NICLEAN_CLI_PARSER_HPP
