/**
 * @file avif_codec.hpp
 * @brief AVIF codec built on libavif.
 */

#ifndef COMICONV_AVIF_CODEC_HPP
#define COMICONV_AVIF_CODEC_HPP

#include "image_codec.hpp"

namespace comiconv {

    /**
     * @brief AVIF codec. Quality and speed are handed to libavif unchanged.
     */
    class AvifCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "AvifCodec"; }
        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Avif; }

        [[nodiscard]] Raster decode(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& image, const ConversionJob& job) const override;
    };

} // namespace comiconv

#endif // COMICONV_AVIF_CODEC_HPP
