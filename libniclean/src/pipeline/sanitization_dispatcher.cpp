#include "../../include/sanitization_dispatcher.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/niclean_errors.hpp"
#include "../../include/process_runner.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace niclean {

namespace {

    // removes whatever temporaries are still on disk when the file is done
    struct TempFiles {
        std::vector<fs::path> paths;

        fs::path add(fs::path p) {
            paths.push_back(p);
            return p;
        }

        ~TempFiles() {
            for (const auto& p : paths) {
                std::error_code ec;
                if (fs::exists(p, ec)) {
                    remove_quietly(p, "dispatcher");
                }
            }
        }
    };

    // short work-copy name carrying only the source extension
    std::string work_name_hint(const fs::path& source) {
        constexpr std::size_t kMaxExtension = 16;
        const auto ext = source.extension().string();
        return ext.size() <= kMaxExtension ? "work" + ext : "work";
    }

    std::string trim_output(std::string s) {
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
        return s;
    }

} // namespace

SanitizationDispatcher::SanitizationDispatcher(DispatcherOptions options)
    : options_(std::move(options)) {}

SanitizationResult SanitizationDispatcher::sanitize(const MediaFile& file,
                                                    const fs::path& destination,
                                                    const CapabilitySet& capabilities) const {
    const auto start = std::chrono::steady_clock::now();

    SanitizationResult r;
    r.source = file.path;
    r.destination = destination;
    r.kind = file.kind;
    r.size_before = file.size;

    const Capability* tool = capabilities.for_kind(file.kind);
    if (!tool) {
        r.outcome = Outcome::SkippedUnsupported;
        r.reason = Reason::NotMedia;
        r.destination.clear();
        return r;
    }

    if (options_.dry_run) {
        r.outcome = Outcome::SkippedDryRun;
        r.reason = tool->available ? Reason::None : Reason::ToolUnavailable;
        Logger::log(LogLevel::Info, "[DRY-RUN] " + file.path.filename().string() + " -> "
                    + destination.filename().string(), "dispatcher");
        return r;
    }

    TempFiles temps;
    try {
        guard_write_target(destination);

        // keep the source extension on the work copy: exiftool trusts it
        const auto work = temps.add(make_temp_path_in(options_.output_root, work_name_hint(file.path)));
        copy_source(file.path, work);

        if (!tool->available) {
            commit(work, destination);
            r.outcome = Outcome::CopiedStripSkipped;
            r.reason = Reason::ToolUnavailable;
        } else {
            StripOutcome s = file.kind == MediaKind::Image
                ? strip_image(*tool, work)
                : strip_video(*tool, work,
                              temps.add(make_temp_path_in(options_.output_root, destination.filename().string())));

            if (s.status == StripStatus::Stripped) {
                commit(s.output, destination);
                r.outcome = Outcome::CopiedAndStripped;
            } else {
                Logger::log(LogLevel::Warning, std::string(tool_name(tool->kind)) + " failed on "
                            + file.path.filename().string() + ", keeping unstripped copy: " + s.message,
                            "dispatcher");
                commit(work, destination);
                r.outcome = Outcome::CopiedStripSkipped;
                r.reason = Reason::ToolError;
                r.detail = std::move(s.message);
            }
        }

        if (options_.keep_timestamps) {
            std::error_code ec;
            const auto mtime = fs::last_write_time(file.path, ec);
            if (!ec) fs::last_write_time(destination, mtime, ec);
            if (ec) {
                Logger::log(LogLevel::Warning, "Cannot copy timestamp to " + destination.string()
                            + ": " + ec.message(), "dispatcher");
            }
        }

        std::error_code ec;
        const auto size = fs::file_size(destination, ec);
        r.size_after = ec ? 0 : size;

    } catch (const FileError& e) {
        Logger::log(LogLevel::Error, file.path.filename().string() + ": " + e.what(), "dispatcher");
        r.outcome = Outcome::Failed;
        r.reason = e.reason();
        r.detail = e.what();
        r.size_after = 0;
    }

    r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    return r;
}

SanitizationDispatcher::StripOutcome SanitizationDispatcher::strip_image(const Capability& tool,
                                                                         const fs::path& work) const {
    guard_write_target(work);
    const std::vector<std::string> args{"-all=", "-overwrite_original", "-P", work.string()};
    try {
        const auto res = ProcessRunner::run(*tool.executable, args, options_.tool_timeout);
        if (res.timed_out) {
            throw FileError(Reason::ToolTimeout, "exiftool timed out");
        }
        if (res.exit_code != 0) {
            return {StripStatus::ToolFailed, work, trim_output(res.output)};
        }
        return {StripStatus::Stripped, work, {}};
    } catch (const std::system_error& e) {
        return {StripStatus::ToolFailed, work, e.what()};
    }
}

SanitizationDispatcher::StripOutcome SanitizationDispatcher::strip_video(const Capability& tool,
                                                                         const fs::path& work,
                                                                         const fs::path& remuxed) const {
    guard_write_target(remuxed);
    const std::vector<std::string> args{
        "-hide_banner", "-loglevel", "error", "-nostdin", "-y",
        "-i", work.string(),
        "-map_metadata", "-1",
        "-map_chapters", "-1",
        "-c", "copy",
        remuxed.string()
    };
    try {
        const auto res = ProcessRunner::run(*tool.executable, args, options_.tool_timeout);
        if (res.timed_out) {
            throw FileError(Reason::ToolTimeout, "ffmpeg timed out");
        }
        std::error_code ec;
        if (res.exit_code != 0 || !fs::is_regular_file(remuxed, ec)) {
            return {StripStatus::ToolFailed, work, trim_output(res.output)};
        }
        return {StripStatus::Stripped, remuxed, {}};
    } catch (const std::system_error& e) {
        return {StripStatus::ToolFailed, work, e.what()};
    }
}

void SanitizationDispatcher::guard_write_target(const fs::path& target) const {
    std::error_code ec;
    const bool is_root = fs::absolute(target, ec).lexically_normal() == fs::absolute(options_.output_root, ec).lexically_normal();
    if (is_root || !is_within(options_.output_root, target)) {
        throw FileError(Reason::WriteFailed, "refusing to write outside the output folder: " + target.string());
    }
}

void SanitizationDispatcher::copy_source(const fs::path& source, const fs::path& target) const {
    guard_write_target(target);

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw FileError(Reason::UnreadableSource, "cannot open " + source.string() + ": " + std::strerror(errno));
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw FileError(Reason::WriteFailed, "cannot create " + target.string() + ": " + std::strerror(errno));
    }
    // streaming an empty buffer would set failbit on out
    if (in.peek() != std::ifstream::traits_type::eof()) {
        out << in.rdbuf();
    }
    if (in.bad()) {
        throw FileError(Reason::UnreadableSource, "read error on " + source.string());
    }
    out.flush();
    if (!out) {
        throw FileError(Reason::WriteFailed, "write error on " + target.string());
    }
}

void SanitizationDispatcher::commit(const fs::path& temp, const fs::path& destination) const {
    guard_write_target(destination);
    std::error_code ec;
    fs::rename(temp, destination, ec);
    if (ec) {
        throw FileError(Reason::WriteFailed, "cannot move into place " + destination.string() + ": " + ec.message());
    }
}

} // namespace niclean
