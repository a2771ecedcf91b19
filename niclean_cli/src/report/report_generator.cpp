#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace niclean;

namespace {

bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

const char* outcome_color(const Outcome outcome) {
    switch (outcome) {
        case Outcome::CopiedAndStripped:  return GREEN;
        case Outcome::CopiedStripSkipped: return YELLOW;
        case Outcome::Failed:             return RED;
        case Outcome::SkippedDryRun:      return CYAN;
        case Outcome::SkippedUnsupported: return "";
    }
    return "";
}

std::string seconds_of(const SanitizationResult& r) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(r.duration.count()) / 1000.0;
    return oss.str();
}

std::string reason_of(const SanitizationResult& r) {
    if (r.reason == Reason::None) return "";
    std::string s(to_string(r.reason));
    if (!r.detail.empty() && r.outcome == Outcome::Failed) {
        s += ": " + r.detail;
    }
    return s;
}

std::string tool_status(const Capability& cap) {
    std::string s(tool_name(cap.kind));
    if (!cap.available) return s + ": not found";
    s += ": " + (cap.executable ? cap.executable->string() : std::string("?"));
    if (!cap.version.empty()) s += " (" + cap.version + ")";
    return s;
}

} // namespace

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

void print_console_report(const BatchReport& report, const unsigned num_threads) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    std::size_t max_dest = 12;
    std::size_t max_result = 8;
    std::size_t max_reason = 6;
    for (const auto& r : report.results) {
        max_dest   = std::max(max_dest,   r.destination.filename().string().size() + 2);
        max_result = std::max(max_result, to_string(r.outcome).size() + 2);
        max_reason = std::max(max_reason, reason_of(r).size() + 2);
    }
    constexpr std::size_t kind_width = 13;
    constexpr std::size_t size_width = 12;
    constexpr std::size_t time_width = 9;

    const std::size_t fixed_cols_width = max_dest + max_result + max_reason + kind_width
                                         + 2 * size_width + time_width;
    const std::size_t file_col_width = term_width > fixed_cols_width + 10
                                       ? term_width - fixed_cols_width
                                       : 20;

    auto truncate = [](const std::string& s, const std::size_t max_len) {
        return s.size() < max_len ? s : s.substr(0, max_len - 4) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_dest))   << "Renamed to"
              << std::setw(static_cast<int>(kind_width)) << "Kind"
              << std::setw(static_cast<int>(max_result)) << "Result"
              << std::setw(static_cast<int>(size_width)) << "Before(KB)"
              << std::setw(static_cast<int>(size_width)) << "After(KB)"
              << std::setw(static_cast<int>(time_width)) << "Time(s)"
              << "Reason"
              << "\n";

    for (const auto& r : report.results) {
        const auto rel = r.source.lexically_relative(report.input_root);
        const auto name = rel.empty() ? r.source.filename().string() : rel.string();
        const std::string outcome(to_string(r.outcome));

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width)) << truncate(name, file_col_width)
                  << std::setw(static_cast<int>(max_dest)) << r.destination.filename().string()
                  << std::setw(static_cast<int>(kind_width)) << to_string(r.kind);
        if (use_colors) std::cerr << outcome_color(r.outcome);
        std::cerr << std::setw(static_cast<int>(max_result)) << outcome;
        if (use_colors) std::cerr << RESET;
        std::cerr << std::setw(static_cast<int>(size_width)) << (r.size_before / 1024)
                  << std::setw(static_cast<int>(size_width)) << (r.size_after / 1024)
                  << std::setw(static_cast<int>(time_width)) << seconds_of(r)
                  << reason_of(r)
                  << "\n";
    }

    const auto counts = report.counts();
    std::cerr << "\nPreset: " << to_string(report.preset)
              << (report.dry_run ? "  [DRY-RUN]" : "") << "\n"
              << "Output: " << report.output_root.string() << "\n"
              << "Tools: " << tool_status(report.capabilities.image) << "; "
              << tool_status(report.capabilities.video) << "\n";
    std::cerr << "Stripped: " << counts.stripped
              << ", copied without stripping: " << counts.strip_skipped
              << ", failed: " << counts.failed
              << ", dry-run: " << counts.dry_run
              << ", unsupported: " << counts.unsupported << "\n";
    if (report.cancelled) {
        std::cerr << (use_colors ? YELLOW : "") << "Batch interrupted: results are partial."
                  << (use_colors ? RESET : "") << "\n";
    }
    std::cerr << "Total time: " << std::fixed << std::setprecision(2)
              << report.seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const BatchReport& report, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Source,Destination,Kind,Result,Reason,Before(B),After(B),Time(s),Detail\n";
    for (const auto& r : report.results) {
        out << csv_escape(r.source.string()) << ","
            << csv_escape(r.destination.string()) << ","
            << to_string(r.kind) << ","
            << csv_escape(std::string(to_string(r.outcome))) << ","
            << to_string(r.reason) << ","
            << r.size_before << ","
            << r.size_after << ","
            << seconds_of(r) << ","
            << csv_escape(r.detail) << "\n";
    }

    const auto counts = report.counts();
    out << "\n\nPreset,Dry run,Cancelled,Stripped,Copied without stripping,Failed,Unsupported,Total time(s)\n";
    out << to_string(report.preset) << ","
        << (report.dry_run ? "yes" : "no") << ","
        << (report.cancelled ? "yes" : "no") << ","
        << counts.stripped << ","
        << counts.strip_skipped << ","
        << counts.failed << ","
        << counts.unsupported << ","
        << std::fixed << std::setprecision(2) << report.seconds << "\n";
    return static_cast<bool>(out);
}
