#ifndef NICLEAN_REPORT_GENERATOR_HPP
#define NICLEAN_REPORT_GENERATOR_HPP

#include "../../../libniclean/include/sanitization_result.hpp"
#include <filesystem>

/**
 * @brief Prints the per-file table and the batch summary to stderr.
 */
void print_console_report(const niclean::BatchReport& report, unsigned num_threads);

/**
 * @brief Writes one CSV row per file plus a summary block.
 * @return false if @p output_path could not be opened.
 */
bool export_csv_report(const niclean::BatchReport& report, const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif // NICLEAN_REPORT_GENERATOR_HPP
