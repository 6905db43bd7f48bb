/**
 * @file jpeg_codec.hpp
 * @brief JPEG codec built on libjpeg.
 */

#ifndef COMICONV_JPEG_CODEC_HPP
#define COMICONV_JPEG_CODEC_HPP

#include "image_codec.hpp"

namespace comiconv {

    /**
     * @brief Baseline JPEG codec. Alpha is dropped on encode; speed is ignored.
     */
    class JpegCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "JpegCodec"; }
        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Jpeg; }

        [[nodiscard]] Raster decode(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& image, const ConversionJob& job) const override;
    };

} // namespace comiconv

#endif // COMICONV_JPEG_CODEC_HPP
