/**
 * @file png_codec.hpp
 * @brief PNG codec built on libpng.
 */

#ifndef COMICONV_PNG_CODEC_HPP
#define COMICONV_PNG_CODEC_HPP

#include "image_codec.hpp"

namespace comiconv {

    /**
     * @brief Lossless PNG codec. Speed selects one of three zlib levels, quality is ignored.
     */
    class PngCodec final : public IImageCodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override { return "PngCodec"; }
        [[nodiscard]] ImageFormat format() const noexcept override { return ImageFormat::Png; }

        [[nodiscard]] Raster decode(std::span<const std::uint8_t> data) const override;
        [[nodiscard]] std::vector<std::uint8_t> encode(const Raster& image, const ConversionJob& job) const override;
    };

} // namespace comiconv

#endif // COMICONV_PNG_CODEC_HPP
