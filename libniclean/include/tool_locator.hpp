/**
 * @file tool_locator.hpp
 * @brief Strategies that propose candidate executables for a tool name.
 */

#ifndef NICLEAN_TOOL_LOCATOR_HPP
#define NICLEAN_TOOL_LOCATOR_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace niclean {

/**
 * @brief One step of the tool lookup order.
 *
 * A locator only proposes paths that exist and are executable; whether a
 * candidate actually works is decided by the resolver's probe.
 */
class IToolLocator {
public:
    virtual ~IToolLocator() = default;

    /// @return Short description used in log messages (e.g. "bundled").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Candidate executables for @p tool, best first.
     * @param tool Bare tool name, e.g. "exiftool".
     */
    [[nodiscard]] virtual std::vector<std::filesystem::path> candidates(std::string_view tool) const = 0;
};

/**
 * @brief Looks in a bundled tools directory (by default "tools/" beside the executable).
 *
 * Both "<tool>" and "<tool>.exe" are tried, so a tools folder laid out for
 * Windows packages works unchanged.
 */
class BundledToolLocator final : public IToolLocator {
public:
    explicit BundledToolLocator(std::filesystem::path tools_dir);

    [[nodiscard]] std::string_view get_name() const noexcept override { return "bundled"; }
    [[nodiscard]] std::vector<std::filesystem::path> candidates(std::string_view tool) const override;

private:
    std::filesystem::path tools_dir_;
};

/**
 * @brief Walks a colon-separated search path, like the shell does with $PATH.
 *
 * Empty entries mean the current directory, as in POSIX.
 */
class SearchPathLocator final : public IToolLocator {
public:
    explicit SearchPathLocator(std::string search_path);

    /// @return A locator over the current process' $PATH.
    static SearchPathLocator from_environment();

    [[nodiscard]] std::string_view get_name() const noexcept override { return "PATH"; }
    [[nodiscard]] std::vector<std::filesystem::path> candidates(std::string_view tool) const override;

private:
    std::vector<std::filesystem::path> dirs_;
};

} // namespace niclean

#endif // NICLEAN_TOOL_LOCATOR_HPP
