/**
 * @file webp_codec.hpp
 * @brief WebP codec built on libwebp.
 */

#ifndef COMICONV_WEBP_CODEC_HPP
#define COMICONV_WEBP_CODEC_HPP

#include "image_codec.hpp"

namespace comiconv {

    /**
     * @brief WebP codec. Always encodes losslessly; speed selects the lossless preset.
     */
    class WebpCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "WebpCodec"; }
        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Webp; }

        [[nodiscard]] Raster decode(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& image, const ConversionJob& job) const override;
    };

} // namespace comiconv

#endif // COMICONV_WEBP_CODEC_HPP
