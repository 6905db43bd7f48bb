#include "../../include/webp_codec.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace comiconv {

namespace {

struct WebPFreeDeleter {
    void operator()(std::uint8_t* p) const { WebPFree(p); }
};

/**
 * @brief Owns a WebPPicture and its memory writer.
 */
struct WebPEncodeState {
    WebPPicture picture{};
    WebPMemoryWriter writer{};

    WebPEncodeState() {
        if (!WebPPictureInit(&picture)) {
            throw std::runtime_error("WebPPictureInit failed");
        }
        WebPMemoryWriterInit(&writer);
        picture.writer = WebPMemoryWrite;
        picture.custom_ptr = &writer;
    }
    ~WebPEncodeState() {
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
    }
};

} // namespace

Raster WebpCodec::decode(std::span<const std::uint8_t> data) const {
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        throw std::runtime_error("WebP feature detection failed");
    }
    if (features.has_animation) {
        throw std::runtime_error("animated WebP is not supported");
    }

    Raster img;
    int width = 0, height = 0;
    std::unique_ptr<std::uint8_t, WebPFreeDeleter> decoded(
        features.has_alpha ? WebPDecodeRGBA(data.data(), data.size(), &width, &height)
                           : WebPDecodeRGB(data.data(), data.size(), &width, &height));
    if (!decoded) {
        throw std::runtime_error("WebP decode failed");
    }
    img.width = static_cast<std::uint32_t>(width);
    img.height = static_cast<std::uint32_t>(height);
    img.channels = features.has_alpha ? 4 : 3;
    img.pixels.assign(decoded.get(), decoded.get() + img.stride() * img.height);
    return img;
}

std::vector<std::uint8_t> WebpCodec::encode(const Raster& image, const ConversionJob& job) const {
    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw std::runtime_error("WebPConfigInit failed");
    }
    const int level = webp_lossless_level(job.speed);
    if (!WebPConfigLosslessPreset(&config, level)) {
        throw std::runtime_error("WebPConfigLosslessPreset(" + std::to_string(level) + ") failed");
    }
    config.thread_level = 0;
    Logger::log(LogLevel::Debug, "lossless preset " + std::to_string(level), "webp_codec");

    WebPEncodeState state;
    state.picture.use_argb = 1;
    state.picture.width = static_cast<int>(image.width);
    state.picture.height = static_cast<int>(image.height);

    const int stride = static_cast<int>(image.stride());
    const int ok = image.has_alpha()
        ? WebPPictureImportRGBA(&state.picture, image.pixels.data(), stride)
        : WebPPictureImportRGB(&state.picture, image.pixels.data(), stride);
    if (!ok) {
        throw std::runtime_error("WebPPictureImport failed");
    }

    if (!WebPEncode(&config, &state.picture)) {
        throw std::runtime_error("WebPEncode failed (error " + std::to_string(state.picture.error_code) + ")");
    }
    return {state.writer.mem, state.writer.mem + state.writer.size};
}

} // namespace comiconv
