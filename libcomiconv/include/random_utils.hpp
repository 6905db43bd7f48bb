#ifndef COMICONV_RANDOM_UTILS_HPP
#define COMICONV_RANDOM_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief Random names for per-run scratch directories.
 *
 * Each thread owns its generator; suffixes also carry the process id so two
 * comiconv processes on the same file never pick the same directory.
 */
namespace RandomUtils {

    std::uint64_t next_u64();

    /**
     * @brief "<pid>-<hex>" with `hex_digits` random lowercase hex digits (1..16).
     */
    std::string random_suffix(std::size_t hex_digits = 12);

} // namespace RandomUtils

#endif // COMICONV_RANDOM_UTILS_HPP
