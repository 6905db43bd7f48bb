/**
 * @file jxl_codec.hpp
 * @brief JPEG XL codec built on libjxl.
 */

#ifndef COMICONV_JXL_CODEC_HPP
#define COMICONV_JXL_CODEC_HPP

#include "image_codec.hpp"

namespace comiconv {

    /**
     * @brief JPEG XL codec. Quality 100 is lossless, lower values map to a Butteraugli distance.
     */
    class JxlCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "JxlCodec"; }
        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::JpegXl; }

        [[nodiscard]] Raster decode(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& image, const ConversionJob& job) const override;
    };

} // namespace comiconv

#endif // COMICONV_JXL_CODEC_HPP
