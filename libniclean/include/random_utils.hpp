#ifndef NICLEAN_RANDOM_UTILS_HPP
#define NICLEAN_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers used to name temporary files.
 *
 * The generator (std::mt19937_64) is thread-local, so concurrent workers of
 * the copy+strip pool never share state.
 */
namespace RandomUtils {

    /// @return A random 64-bit unsigned integer.
    unsigned long long next_u64();

    /// @return 16 lowercase hex digits, suitable as a file name fragment.
    std::string random_suffix();

} // namespace RandomUtils

#endif // NICLEAN_RANDOM_UTILS_HPP
