#include "../../include/config_loader.hpp"
#include "../../include/batch_orchestrator.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace niclean {

namespace {

    std::string trim(std::string_view s) {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r");
        return std::string(s.substr(first, last - first + 1));
    }

    std::optional<unsigned long> parse_unsigned(const std::string& s) {
        unsigned long v = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
        return v;
    }

    void reject(const std::string& key, const std::string& value) {
        Logger::log(LogLevel::Warning, "Ignoring invalid value for " + key + ": '" + value + "'", "config");
    }

} // namespace

std::optional<fs::path> ConfigLoader::locate(const std::vector<fs::path>& search_dirs) {
    for (const auto& dir : search_dirs) {
        if (dir.empty()) continue;
        for (const auto name : kFileNames) {
            const auto candidate = dir / name;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

ConfigValues ConfigLoader::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        Logger::log(LogLevel::Warning, "Could not read config " + path.string(), "config");
        return {};
    }
    std::stringstream buf;
    buf << in.rdbuf();
    Logger::log(LogLevel::Info, "Using config " + path.string(), "config");
    return parse(buf.str());
}

ConfigValues ConfigLoader::parse(const std::string_view text) {
    ConfigValues values;
    std::istringstream lines{std::string(text)};
    std::string raw;
    while (std::getline(lines, raw)) {
        const auto line = trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';') continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        auto key = to_lower(trim(std::string_view(line).substr(0, eq)));
        if (key.empty()) continue;
        values[std::move(key)] = trim(std::string_view(line).substr(eq + 1));
    }
    return values;
}

std::optional<bool> ConfigLoader::parse_bool(const std::string_view value) {
    const auto v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") return false;
    return std::nullopt;
}

std::vector<std::string> ConfigLoader::apply(const ConfigValues& values, BatchOptions& options) {
    std::vector<std::string> applied;

    auto set_bool = [&](const std::string& key, const std::string& value, bool& target) {
        if (const auto b = parse_bool(value)) {
            target = *b;
            applied.push_back(key);
        } else {
            reject(key, value);
        }
    };

    for (const auto& [key, value] : values) {
        if (key == "naming") {
            if (const auto p = parse_preset(value)) {
                options.preset = *p;
                applied.push_back(key);
            } else {
                reject(key, value);
            }
        } else if (key == "output_folder") {
            if (value.empty()) {
                reject(key, value);
            } else {
                options.output_root = options.input_root / value;
                applied.push_back(key);
            }
        } else if (key == "include_subfolders") {
            set_bool(key, value, options.recursive);
        } else if (key == "dry_run") {
            set_bool(key, value, options.dry_run);
        } else if (key == "keep_timestamps") {
            set_bool(key, value, options.keep_timestamps);
        } else if (key == "strict_tools") {
            set_bool(key, value, options.strict_tools);
        } else if (key == "order") {
            if (const auto o = parse_walk_order(value)) {
                options.order = *o;
                applied.push_back(key);
            } else {
                reject(key, value);
            }
        } else if (key == "threads") {
            if (const auto n = parse_unsigned(value); n && *n > 0) {
                options.threads = static_cast<unsigned>(*n);
                applied.push_back(key);
            } else {
                reject(key, value);
            }
        } else if (key == "tool_timeout") {
            if (const auto n = parse_unsigned(value); n && *n > 0) {
                options.tool_timeout = std::chrono::seconds(
                    std::min<unsigned long>(*n, ProcessRunner::kMaxTimeout.count()));
                applied.push_back(key);
            } else {
                reject(key, value);
            }
        } else if (key == "image_extensions" || key == "video_extensions") {
            auto exts = ClassifierOptions::parse_extension_list(value);
            if (exts.empty()) {
                reject(key, value);
                continue;
            }
            (key == "image_extensions" ? options.classifier.image_extensions
                                       : options.classifier.video_extensions) = std::move(exts);
            applied.push_back(key);
        } else {
            Logger::log(LogLevel::Warning, "Unknown config key: " + key, "config");
        }
    }
    return applied;
}

} // namespace niclean
