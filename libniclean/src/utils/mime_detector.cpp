#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"

namespace niclean {

void MimeDetector::CookieDeleter::operator()(magic_set* cookie) const noexcept {
    magic_close(cookie);
}

MimeDetector::MimeDetector() {
    magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) {
        Logger::log(LogLevel::Warning, "magic_open failed; content sniffing disabled", "libmagic");
        return;
    }
    if (magic_load(magic, nullptr) != 0) {
        const char* err = magic_error(magic);
        Logger::log(LogLevel::Warning,
                    std::string("magic_load failed: ") + (err ? err : "unknown error")
                    + "; content sniffing disabled", "libmagic");
        magic_close(magic);
        return;
    }
    cookie_.reset(magic);
}

MimeDetector::~MimeDetector() = default;
MimeDetector::MimeDetector(MimeDetector&&) noexcept = default;
MimeDetector& MimeDetector::operator=(MimeDetector&&) noexcept = default;

std::string MimeDetector::detect(const std::filesystem::path& path) const {
    if (!cookie_) return {};
    const char* mime = magic_file(cookie_.get(), path.c_str());
    return mime ? mime : "";
}

} // namespace niclean
