#include "../../include/avif_codec.hpp"
#include "../../include/logger.hpp"
#include <avif/avif.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace comiconv {

namespace {

struct AvifDecoderDeleter {
    void operator()(avifDecoder* d) const { avifDecoderDestroy(d); }
};
struct AvifEncoderDeleter {
    void operator()(avifEncoder* e) const { avifEncoderDestroy(e); }
};
struct AvifImageDeleter {
    void operator()(avifImage* i) const { avifImageDestroy(i); }
};

/**
 * @brief Owns the output buffer of avifEncoderWrite.
 */
struct AvifOutput {
    avifRWData data = AVIF_DATA_EMPTY;
    ~AvifOutput() { avifRWDataFree(&data); }
};

void check(const avifResult result, const char* what) {
    if (result != AVIF_RESULT_OK) {
        throw std::runtime_error(std::string(what) + ": " + avifResultToString(result));
    }
}

} // namespace

Raster AvifCodec::decode(std::span<const std::uint8_t> data) const {
    std::unique_ptr<avifDecoder, AvifDecoderDeleter> decoder(avifDecoderCreate());
    if (!decoder) throw std::runtime_error("avifDecoderCreate failed");
    decoder->maxThreads = 1;

    check(avifDecoderSetIOMemory(decoder.get(), data.data(), data.size()), "avifDecoderSetIOMemory");
    check(avifDecoderParse(decoder.get()), "avifDecoderParse");
    check(avifDecoderNextImage(decoder.get()), "avifDecoderNextImage");

    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, decoder->image);
    rgb.depth = 8;
    rgb.format = decoder->alphaPresent ? AVIF_RGB_FORMAT_RGBA : AVIF_RGB_FORMAT_RGB;

    Raster img;
    img.width = decoder->image->width;
    img.height = decoder->image->height;
    img.channels = decoder->alphaPresent ? 4 : 3;
    img.pixels.resize(img.stride() * img.height);

    // decode straight into the raster
    rgb.pixels = img.pixels.data();
    rgb.rowBytes = static_cast<std::uint32_t>(img.stride());
    check(avifImageYUVToRGB(decoder->image, &rgb), "avifImageYUVToRGB");
    return img;
}

std::vector<std::uint8_t> AvifCodec::encode(const Raster& image, const ConversionJob& job) const {
    std::unique_ptr<avifImage, AvifImageDeleter> avif(
        avifImageCreate(image.width, image.height, 8, AVIF_PIXEL_FORMAT_YUV420));
    if (!avif) throw std::runtime_error("avifImageCreate failed");

    avifRGBImage rgb;
    avifRGBImageSetDefaults(&rgb, avif.get());
    rgb.depth = 8;
    rgb.format = image.has_alpha() ? AVIF_RGB_FORMAT_RGBA : AVIF_RGB_FORMAT_RGB;
    rgb.pixels = const_cast<std::uint8_t*>(image.pixels.data());
    rgb.rowBytes = static_cast<std::uint32_t>(image.stride());
    check(avifImageRGBToYUV(avif.get(), &rgb), "avifImageRGBToYUV");

    std::unique_ptr<avifEncoder, AvifEncoderDeleter> encoder(avifEncoderCreate());
    if (!encoder) throw std::runtime_error("avifEncoderCreate failed");
    encoder->maxThreads = 1;
    encoder->speed = avif_speed(job.speed);
    encoder->quality = job.quality;
    encoder->qualityAlpha = job.quality;
    Logger::log(LogLevel::Debug,
                "quality " + std::to_string(job.quality) + ", speed " + std::to_string(encoder->speed),
                "avif_codec");

    AvifOutput out;
    check(avifEncoderWrite(encoder.get(), avif.get(), &out.data), "avifEncoderWrite");
    return {out.data.data, out.data.data + out.data.size};
}

} // namespace comiconv
