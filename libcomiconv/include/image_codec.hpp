/**
 * @file image_codec.hpp
 * @brief Interface implemented by every image codec.
 */

#ifndef COMICONV_IMAGE_CODEC_HPP
#define COMICONV_IMAGE_CODEC_HPP

#include "conversion_job.hpp"
#include "image_format.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * @namespace comiconv
 * @brief The main namespace of the comiconv library.
 *
 * @details Contains the codecs, the archive containers, the local
 * orchestration (ArchiveOrchestrator, WorkerPool), the remote protocol client
 * (RemoteSession) and the public Converter facade.
 */
namespace comiconv {

/**
 * @brief A decoded image: 8 bits per sample, rows packed without padding.
 */
struct Raster {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::uint32_t channels = 4;       ///< 3 (RGB) or 4 (RGBA)
    std::vector<std::uint8_t> pixels; ///< width * height * channels bytes

    [[nodiscard]] bool has_alpha() const noexcept { return channels == 4; }
    [[nodiscard]] std::size_t stride() const noexcept { return static_cast<std::size_t>(width) * channels; }
};

/**
 * @brief Decoder and encoder for one image format.
 *
 * Implementations are stateless: the same instance is used concurrently by
 * every worker thread. Failures are reported with std::runtime_error; the
 * worker pool attaches the entry index.
 */
class IImageCodec {
public:
    virtual ~IImageCodec() = default;

    /// @return Human-readable name (e.g. "PngCodec").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The format this codec reads and writes.
    [[nodiscard]] virtual ImageFormat format() const noexcept = 0;

    /**
     * @brief Decodes a complete image file held in memory.
     * @return An RGB8 or RGBA8 raster.
     * @throws std::runtime_error if the data cannot be decoded.
     */
    [[nodiscard]] virtual Raster decode(std::span<const std::uint8_t> data) const = 0;

    /**
     * @brief Encodes a raster using the quality and speed of `job`.
     *
     * `job` is already normalised; mapping the generic 0..100 quality and
     * 0..10 speed onto the library's own knobs is up to the codec.
     * @throws std::runtime_error if encoding fails.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> encode(const Raster& image, const ConversionJob& job) const = 0;
};

} // namespace comiconv

#endif // COMICONV_IMAGE_CODEC_HPP
