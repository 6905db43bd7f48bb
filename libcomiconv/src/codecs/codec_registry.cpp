#include "../../include/codec_registry.hpp"
#include "../../include/avif_codec.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/jxl_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/png_codec.hpp"
#include "../../include/webp_codec.hpp"
#include <stdexcept>
#include <string>

namespace comiconv {

CodecRegistry::CodecRegistry() {
    codecs_.push_back(std::make_unique<AvifCodec>());
    codecs_.push_back(std::make_unique<WebpCodec>());
    codecs_.push_back(std::make_unique<PngCodec>());
    codecs_.push_back(std::make_unique<JpegCodec>());
    codecs_.push_back(std::make_unique<JxlCodec>());
}

const IImageCodec* CodecRegistry::find(const ImageFormat format) const noexcept {
    for (const auto& codec : codecs_) {
        if (codec->format() == format) return codec.get();
    }
    return nullptr;
}

ImageFormat CodecRegistry::detect(std::span<const std::uint8_t> data) {
    if (const auto fmt = sniff_image_format(data); fmt != ImageFormat::Unknown) {
        return fmt;
    }
    const std::string mime = MimeDetector::detect(data);
    if (const auto it = mime_to_image_format.find(mime); it != mime_to_image_format.end()) {
        Logger::log(LogLevel::Debug, "Format detected by libmagic: " + mime, "codec_registry");
        return it->second;
    }
    return ImageFormat::Unknown;
}

std::vector<std::uint8_t> CodecRegistry::transcode(std::span<const std::uint8_t> data,
                                                   const ConversionJob& job) const {
    const ImageFormat source = detect(data);
    const IImageCodec* decoder = find(source);
    if (!decoder) {
        throw std::runtime_error("not a supported image");
    }
    const IImageCodec* encoder = find(job.target_format);
    if (!encoder) {
        throw std::runtime_error("no encoder for ." + image_format_extension(job.target_format));
    }

    const Raster raster = decoder->decode(data);
    if (raster.width == 0 || raster.height == 0) {
        throw std::runtime_error(std::string(decoder->get_name()) + " produced an empty image");
    }
    return encoder->encode(raster, job);
}

} // namespace comiconv
