#include "../../include/tool_locator.hpp"
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace niclean {

namespace {

    bool is_executable_file(const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    }

} // namespace

BundledToolLocator::BundledToolLocator(fs::path tools_dir)
    : tools_dir_(std::move(tools_dir)) {}

std::vector<fs::path> BundledToolLocator::candidates(const std::string_view tool) const {
    std::vector<fs::path> out;
    if (tools_dir_.empty()) return out;

    for (const auto& name : {std::string(tool), std::string(tool) + ".exe"}) {
        auto p = tools_dir_ / name;
        if (is_executable_file(p)) {
            out.push_back(std::move(p));
        }
    }
    return out;
}

SearchPathLocator::SearchPathLocator(std::string search_path) {
    if (search_path.empty()) return;

    std::stringstream ss(search_path);
    std::string entry;
    while (std::getline(ss, entry, ':')) {
        dirs_.emplace_back(entry.empty() ? "." : entry);
    }
    // getline drops a trailing empty field
    if (search_path.back() == ':') {
        dirs_.emplace_back(".");
    }
}

SearchPathLocator SearchPathLocator::from_environment() {
    const char* path = std::getenv("PATH");
    return SearchPathLocator(path ? path : "");
}

std::vector<fs::path> SearchPathLocator::candidates(const std::string_view tool) const {
    std::vector<fs::path> out;
    for (const auto& dir : dirs_) {
        auto p = dir / tool;
        if (!is_executable_file(p)) continue;

        std::error_code ec;
        auto abs = fs::absolute(p, ec);
        out.push_back(ec ? std::move(p) : std::move(abs));
    }
    return out;
}

} // namespace niclean
