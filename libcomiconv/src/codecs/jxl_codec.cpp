#include "../../include/jxl_codec.hpp"
#include "../../include/logger.hpp"
#include <jxl/decode.h>
#include <jxl/decode_cxx.h>
#include <jxl/encode.h>
#include <jxl/encode_cxx.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace comiconv {

namespace {

/// Quality 0..99 onto a Butteraugli distance, the scale cjxl uses.
float jxl_distance(const int quality) {
    return JxlEncoderDistanceFromQuality(static_cast<float>(quality));
}

} // namespace

Raster JxlCodec::decode(std::span<const std::uint8_t> data) const {
    const JxlDecoderPtr dec = JxlDecoderMake(nullptr);
    if (!dec) throw std::runtime_error("JxlDecoderMake failed");

    if (JxlDecoderSubscribeEvents(dec.get(), JXL_DEC_BASIC_INFO | JXL_DEC_FULL_IMAGE) != JXL_DEC_SUCCESS) {
        throw std::runtime_error("JxlDecoderSubscribeEvents failed");
    }
    if (JxlDecoderSetInput(dec.get(), data.data(), data.size()) != JXL_DEC_SUCCESS) {
        throw std::runtime_error("JxlDecoderSetInput failed");
    }
    JxlDecoderCloseInput(dec.get());

    Raster img;
    JxlBasicInfo info{};
    JxlPixelFormat format = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    bool have_image = false;

    for (;;) {
        const JxlDecoderStatus status = JxlDecoderProcessInput(dec.get());
        if (status == JXL_DEC_ERROR) {
            throw std::runtime_error("JPEG XL decode failed");
        }
        if (status == JXL_DEC_NEED_MORE_INPUT) {
            throw std::runtime_error("truncated JPEG XL data");
        }
        if (status == JXL_DEC_BASIC_INFO) {
            if (JxlDecoderGetBasicInfo(dec.get(), &info) != JXL_DEC_SUCCESS) {
                throw std::runtime_error("JxlDecoderGetBasicInfo failed");
            }
            img.width = info.xsize;
            img.height = info.ysize;
            img.channels = info.alpha_bits > 0 ? 4 : 3;
            format.num_channels = img.channels;
        } else if (status == JXL_DEC_NEED_IMAGE_OUT_BUFFER) {
            img.pixels.resize(img.stride() * img.height);
            if (JxlDecoderSetImageOutBuffer(dec.get(), &format, img.pixels.data(), img.pixels.size())
                != JXL_DEC_SUCCESS) {
                throw std::runtime_error("JxlDecoderSetImageOutBuffer failed");
            }
        } else if (status == JXL_DEC_FULL_IMAGE) {
            // first frame only
            have_image = true;
            break;
        } else if (status == JXL_DEC_SUCCESS) {
            break;
        }
    }
    if (!have_image) {
        throw std::runtime_error("JPEG XL stream contains no image");
    }
    return img;
}

std::vector<std::uint8_t> JxlCodec::encode(const Raster& image, const ConversionJob& job) const {
    const JxlEncoderPtr enc = JxlEncoderMake(nullptr);
    if (!enc) throw std::runtime_error("JxlEncoderMake failed");

    const bool lossless = job.quality >= kMaxQuality;

    JxlBasicInfo info;
    JxlEncoderInitBasicInfo(&info);
    info.xsize = image.width;
    info.ysize = image.height;
    info.bits_per_sample = 8;
    info.exponent_bits_per_sample = 0;
    info.num_color_channels = 3;
    info.num_extra_channels = image.has_alpha() ? 1 : 0;
    info.alpha_bits = image.has_alpha() ? 8 : 0;
    info.uses_original_profile = lossless ? JXL_TRUE : JXL_FALSE;
    if (JxlEncoderSetBasicInfo(enc.get(), &info) != JXL_ENC_SUCCESS) {
        throw std::runtime_error("JxlEncoderSetBasicInfo failed");
    }

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc.get(), &color) != JXL_ENC_SUCCESS) {
        throw std::runtime_error("JxlEncoderSetColorEncoding failed");
    }

    JxlEncoderFrameSettings* settings = JxlEncoderFrameSettingsCreate(enc.get(), nullptr);
    JxlEncoderFrameSettingsSetOption(settings, JXL_ENC_FRAME_SETTING_EFFORT, jxl_effort(job.speed));
    if (lossless) {
        JxlEncoderSetFrameLossless(settings, JXL_TRUE);
    } else {
        JxlEncoderSetFrameDistance(settings, jxl_distance(job.quality));
    }
    Logger::log(LogLevel::Debug,
                std::string(lossless ? "lossless" : "lossy") + ", effort " + std::to_string(jxl_effort(job.speed)),
                "jxl_codec");

    const JxlPixelFormat format = {image.channels, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(settings, &format, image.pixels.data(), image.pixels.size()) != JXL_ENC_SUCCESS) {
        throw std::runtime_error("JxlEncoderAddImageFrame failed");
    }
    JxlEncoderCloseInput(enc.get());

    std::vector<std::uint8_t> out(1 << 16);
    std::uint8_t* next_out = out.data();
    size_t avail_out = out.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc.get(), &next_out, &avail_out)) == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t offset = next_out - out.data();
        out.resize(out.size() * 2);
        next_out = out.data() + offset;
        avail_out = out.size() - offset;
    }
    if (status != JXL_ENC_SUCCESS) {
        throw std::runtime_error("JPEG XL encode failed");
    }
    out.resize(next_out - out.data());
    return out;
}

} // namespace comiconv
