#include "../../include/capture_time_reader.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"
#include <cstdio>
#include <exception>
#include <sstream>
#include <string>

namespace niclean {

CaptureTimeReader::CaptureTimeReader(Capability image_tool, const std::chrono::milliseconds timeout)
    : image_tool_(std::move(image_tool)),
      timeout_(timeout) {}

std::optional<std::time_t> CaptureTimeReader::read(const std::filesystem::path& path) const {
    if (!image_tool_.available || !image_tool_.executable) {
        return std::nullopt;
    }

    const std::vector<std::string> args{
        "-s3", "-d", "%Y:%m:%d %H:%M:%S",
        "-DateTimeOriginal", "-CreateDate",
        path.string()
    };

    try {
        const auto res = ProcessRunner::run(*image_tool_.executable, args, timeout_);
        if (!res.succeeded()) {
            Logger::log(LogLevel::Debug, "No readable capture time in " + path.filename().string(), "timestamp");
            return std::nullopt;
        }
        std::istringstream lines(res.output);
        std::string line;
        while (std::getline(lines, line)) {
            if (auto t = parse_exif_datetime(line)) {
                return t;
            }
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Warning, "Capture time read failed for " + path.string() + ": " + e.what(), "timestamp");
    }
    return std::nullopt;
}

std::optional<std::time_t> CaptureTimeReader::parse_exif_datetime(const std::string_view text) {
    const std::string s(text);
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (std::sscanf(s.c_str(), "%4d:%2d:%2d %2d:%2d:%2d", &y, &mo, &d, &h, &mi, &sec) != 6) {
        return std::nullopt;
    }
    if (y < 1900 || mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return t;
}

} // namespace niclean
