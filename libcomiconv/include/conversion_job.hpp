/**
 * @file conversion_job.hpp
 * @brief Parameters of one conversion run and their per-format normalisation.
 */

#ifndef COMICONV_CONVERSION_JOB_HPP
#define COMICONV_CONVERSION_JOB_HPP

#include "image_format.hpp"
#include <algorithm>
#include <cstdint>
#include <thread>

namespace comiconv {

inline constexpr int kMaxQuality = 100;
inline constexpr int kMaxSpeed = 10;
inline constexpr int kMaxPngEffort = 2;

/**
 * @brief Immutable parameters for converting one archive.
 *
 * Quality and speed are stored as given; readers go through normalized(),
 * which clamps out-of-range values instead of rejecting them.
 */
struct ConversionJob {
    ImageFormat target_format = ImageFormat::Avif;
    int quality = 30;       ///< 0 (worst) .. 100 (best)
    int speed = 3;          ///< 0 (slowest) .. 10 (fastest); 0 .. 2 effort for PNG
    unsigned thread_count = std::max(1U, std::thread::hardware_concurrency());

    /**
     * @brief Returns a copy with quality in [0,100], speed in [0,10] and at
     * least one thread.
     */
    [[nodiscard]] ConversionJob normalized() const {
        ConversionJob job = *this;
        job.quality = std::clamp(quality, 0, kMaxQuality);
        job.speed = std::clamp(speed, 0, kMaxSpeed);
        if (job.thread_count == 0) job.thread_count = 1;
        return job;
    }

    [[nodiscard]] std::uint8_t wire_quality() const {
        return static_cast<std::uint8_t>(std::clamp(quality, 0, kMaxQuality));
    }

    [[nodiscard]] std::uint8_t wire_speed() const {
        return static_cast<std::uint8_t>(std::clamp(speed, 0, kMaxSpeed));
    }
};

// --- per-format parameter mapping ---

/**
 * @brief PNG compression effort: 0 fastest, 1 default, 2 best.
 * Values above 2 select the best compression.
 */
inline int png_effort(const int speed) {
    return std::clamp(speed, 0, kMaxPngEffort);
}

/// zlib level used by libpng for a given effort.
inline int png_zlib_level(const int speed) {
    switch (png_effort(speed)) {
        case 0:  return 1;
        case 1:  return 6;
        default: return 9;
    }
}

/// libwebp lossless preset level (0 fast .. 9 best). Quality is not used.
inline int webp_lossless_level(const int speed) {
    return std::clamp(9 - speed, 0, 9);
}

/// libjxl effort (1 fast .. 9 slow).
inline int jxl_effort(const int speed) {
    return std::clamp(9 - (std::clamp(speed, 0, kMaxSpeed) * 8) / kMaxSpeed, 1, 9);
}

/// libavif encoder speed, which shares the 0..10 scale.
inline int avif_speed(const int speed) {
    return std::clamp(speed, 0, kMaxSpeed);
}

} // namespace comiconv

#endif // COMICONV_CONVERSION_JOB_HPP
