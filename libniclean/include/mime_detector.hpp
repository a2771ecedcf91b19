#ifndef NICLEAN_MIME_DETECTOR_HPP
#define NICLEAN_MIME_DETECTOR_HPP

#include <filesystem>
#include <memory>
#include <string>

struct magic_set;

namespace niclean {

    /**
     * @brief Content-signature detection backed by libmagic.
     *
     * Holds one loaded magic cookie for its lifetime. A cookie is not safe
     * to share between threads; the classifier owns one and only runs on
     * the orchestrating thread.
     */
    class MimeDetector {
    public:
        /**
         * @brief Opens libmagic and loads the default database.
         *
         * Failure to load is not fatal: detect() then returns an empty string
         * and classification falls back to extensions only.
         */
        MimeDetector();
        ~MimeDetector();

        MimeDetector(const MimeDetector&) = delete;
        MimeDetector& operator=(const MimeDetector&) = delete;
        MimeDetector(MimeDetector&&) noexcept;
        MimeDetector& operator=(MimeDetector&&) noexcept;

        /**
         * @brief Detect the MIME type of a file from its content.
         * @return e.g. "image/jpeg", or an empty string if detection is unavailable or failed.
         */
        [[nodiscard]] std::string detect(const std::filesystem::path& path) const;

        /// @return true if the magic database loaded.
        [[nodiscard]] bool is_ready() const noexcept { return cookie_ != nullptr; }

    private:
        struct CookieDeleter {
            void operator()(magic_set* cookie) const noexcept;
        };
        std::unique_ptr<magic_set, CookieDeleter> cookie_;
    };

} // namespace niclean

#endif // NICLEAN_MIME_DETECTOR_HPP
