#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sys/stat.h>
#include <system_error>

namespace fs = std::filesystem;

namespace niclean {

    std::string to_lower(std::string s) {
        std::ranges::transform(s, s.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string to_upper(std::string s) {
        std::ranges::transform(s, s.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    bool is_within(const fs::path& root, const fs::path& path) {
        std::error_code ec;
        const auto r = fs::absolute(root, ec).lexically_normal();
        if (ec) return false;
        const auto p = fs::absolute(path, ec).lexically_normal();
        if (ec) return false;

        auto rit = r.begin();
        auto pit = p.begin();
        for (; rit != r.end(); ++rit, ++pit) {
            // a trailing separator normalizes to an empty final element
            if (rit->empty() && std::next(rit) == r.end()) break;
            if (pit == p.end() || *rit != *pit) return false;
        }
        return true;
    }

    fs::path executable_directory() {
        std::error_code ec;
        const auto exe = fs::read_symlink("/proc/self/exe", ec);
        if (!ec && !exe.empty()) {
            return exe.parent_path();
        }
        Logger::log(LogLevel::Debug, "/proc/self/exe unavailable, using current directory", "file_utils");
        return fs::current_path(ec);
    }

    fs::path make_temp_path_in(const fs::path& dir, const std::string_view name_hint) {
        std::string name(kTempPrefix);
        name += RandomUtils::random_suffix();
        name += '-';
        name += name_hint;
        return dir / name;
    }

    bool is_temp_file(const fs::path& path) {
        return path.filename().string().starts_with(kTempPrefix);
    }

    bool is_junk_file(const fs::path& path) {
        const auto name = to_lower(path.filename().string());
        return name == ".ds_store" || name == "desktop.ini" || name == "thumbs.db" || name.starts_with("._");
    }

    std::optional<std::time_t> modification_time(const fs::path& path) {
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) {
            return std::nullopt;
        }
        return st.st_mtime;
    }

    void remove_quietly(const fs::path& path, const std::string_view tag) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove " + path.string() + " (" + ec.message() + ")", tag);
        }
    }

} // namespace niclean
