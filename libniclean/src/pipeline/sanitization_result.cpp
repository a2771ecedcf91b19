#include "../../include/sanitization_result.hpp"
#include <algorithm>

namespace niclean {

std::string_view to_string(const Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::CopiedAndStripped:  return "stripped";
        case Outcome::CopiedStripSkipped: return "copied (not stripped)";
        case Outcome::Failed:             return "failed";
        case Outcome::SkippedDryRun:      return "dry-run";
        case Outcome::SkippedUnsupported: return "unsupported";
    }
    return "";
}

std::string_view to_string(const Reason reason) noexcept {
    switch (reason) {
        case Reason::None:             return "";
        case Reason::ToolUnavailable:  return "tool unavailable";
        case Reason::ToolError:        return "tool error";
        case Reason::ToolTimeout:      return "tool timeout";
        case Reason::UnreadableSource: return "unreadable source";
        case Reason::WriteFailed:      return "write failed";
        case Reason::NotMedia:         return "not a media file";
    }
    return "";
}

BatchCounts BatchReport::counts() const noexcept {
    BatchCounts c;
    for (const auto& r : results) {
        switch (r.outcome) {
            case Outcome::CopiedAndStripped:  ++c.stripped; break;
            case Outcome::CopiedStripSkipped: ++c.strip_skipped; break;
            case Outcome::Failed:             ++c.failed; break;
            case Outcome::SkippedDryRun:      ++c.dry_run; break;
            case Outcome::SkippedUnsupported: ++c.unsupported; break;
        }
    }
    return c;
}

const SanitizationResult* BatchReport::find(const std::filesystem::path& source) const {
    const auto it = std::ranges::find_if(results, [&](const SanitizationResult& r) {
        return r.source == source;
    });
    return it == results.end() ? nullptr : &*it;
}

} // namespace niclean
