/**
 * @file codec_registry.hpp
 * @brief Registry of the built-in image codecs and the per-entry transcode step.
 */

#ifndef COMICONV_CODEC_REGISTRY_HPP
#define COMICONV_CODEC_REGISTRY_HPP

#include "image_codec.hpp"
#include <memory>
#include <span>
#include <vector>

namespace comiconv {

/**
 * @brief Owns one instance of every IImageCodec implementation.
 *
 * @details Codecs are stateless, so a single registry is shared by all worker
 * threads of a run.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register all built-in codecs.
     */
    CodecRegistry();

    /**
     * @brief Find the codec handling a format.
     * @return A non-owning pointer, or nullptr if none is registered.
     */
    [[nodiscard]] const IImageCodec* find(ImageFormat format) const noexcept;

    /**
     * @brief Identify the format of encoded image bytes.
     *
     * Built-in signatures are checked first, libmagic second.
     * @return The format, or ImageFormat::Unknown.
     */
    [[nodiscard]] static ImageFormat detect(std::span<const std::uint8_t> data);

    /**
     * @brief Decode `data` with the codec of its detected format and
     * re-encode it in the job's target format.
     *
     * @throws std::runtime_error if the input is not a recognised image or
     * either codec fails.
     */
    [[nodiscard]] std::vector<std::uint8_t> transcode(std::span<const std::uint8_t> data,
                                                      const ConversionJob& job) const;

    [[nodiscard]] const std::vector<std::unique_ptr<IImageCodec>>& all() const { return codecs_; }

private:
    std::vector<std::unique_ptr<IImageCodec>> codecs_;
};

} // namespace comiconv

#endif // COMICONV_CODEC_REGISTRY_HPP
