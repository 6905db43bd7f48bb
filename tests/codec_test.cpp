#include <gtest/gtest.h>
#include "../libcomiconv/include/avif_codec.hpp"
#include "../libcomiconv/include/codec_registry.hpp"
#include "../libcomiconv/include/jpeg_codec.hpp"
#include "../libcomiconv/include/jxl_codec.hpp"
#include "../libcomiconv/include/png_codec.hpp"
#include "../libcomiconv/include/webp_codec.hpp"
#include "test_helpers.hpp"

using namespace comiconv;

namespace {

ConversionJob job_for(const ImageFormat fmt, const int quality = 30, const int speed = 3) {
    ConversionJob job;
    job.target_format = fmt;
    job.quality = quality;
    job.speed = speed;
    return job;
}

} // namespace

TEST(PngCodecTest, LosslessRoundTrip) {
    const PngCodec codec;
    const Raster in = test::make_raster(31, 17);
    for (int speed = 0; speed <= 2; ++speed) {
        const auto bytes = codec.encode(in, job_for(ImageFormat::Png, 30, speed));
        EXPECT_EQ(sniff_image_format(bytes), ImageFormat::Png);
        const Raster out = codec.decode(bytes);
        EXPECT_EQ(out.width, 31U);
        EXPECT_EQ(out.height, 17U);
        EXPECT_EQ(out.channels, 4U);
        EXPECT_EQ(out.pixels, in.pixels) << "speed " << speed;
    }
}

TEST(PngCodecTest, RgbStaysRgb) {
    const PngCodec codec;
    const Raster in = test::make_raster(5, 5, 3);
    const Raster out = codec.decode(codec.encode(in, job_for(ImageFormat::Png)));
    EXPECT_EQ(out.channels, 3U);
    EXPECT_EQ(out.pixels, in.pixels);
}

TEST(PngCodecTest, RejectsGarbage) {
    const PngCodec codec;
    EXPECT_THROW((void)codec.decode(test::bytes_of("\x89PNG\r\n\x1a\nbroken")), std::runtime_error);
}

TEST(JpegCodecTest, EncodesAndDecodes) {
    const JpegCodec codec;
    const Raster in = test::make_raster(40, 24);
    const auto bytes = codec.encode(in, job_for(ImageFormat::Jpeg, 90));
    EXPECT_EQ(sniff_image_format(bytes), ImageFormat::Jpeg);

    const Raster out = codec.decode(bytes);
    EXPECT_EQ(out.width, 40U);
    EXPECT_EQ(out.height, 24U);
    EXPECT_EQ(out.channels, 3U);
}

TEST(JpegCodecTest, LowerQualityIsSmaller) {
    const JpegCodec codec;
    const Raster in = test::make_raster(128, 128);
    const auto high = codec.encode(in, job_for(ImageFormat::Jpeg, 95));
    const auto low = codec.encode(in, job_for(ImageFormat::Jpeg, 5));
    EXPECT_LT(low.size(), high.size());
}

TEST(JpegCodecTest, OutOfRangeQualityIsClamped) {
    const JpegCodec codec;
    const Raster in = test::make_raster(16, 16);
    EXPECT_NO_THROW((void)codec.encode(in, job_for(ImageFormat::Jpeg, 400, -2)));
    EXPECT_NO_THROW((void)codec.encode(in, job_for(ImageFormat::Jpeg, -7, 99)));
}

TEST(WebpCodecTest, LosslessRoundTrip) {
    const WebpCodec codec;
    const Raster in = test::make_raster(20, 10, 3);
    const auto bytes = codec.encode(in, job_for(ImageFormat::Webp, 30, 9));
    EXPECT_EQ(sniff_image_format(bytes), ImageFormat::Webp);
    const Raster out = codec.decode(bytes);
    EXPECT_EQ(out.width, 20U);
    EXPECT_EQ(out.height, 10U);
    EXPECT_EQ(out.pixels, in.pixels);
}

TEST(JxlCodecTest, EncodesAndDecodes) {
    const JxlCodec codec;
    const Raster in = test::make_raster(24, 16);
    const auto bytes = codec.encode(in, job_for(ImageFormat::JpegXl, 80, 10));
    EXPECT_EQ(sniff_image_format(bytes), ImageFormat::JpegXl);
    const Raster out = codec.decode(bytes);
    EXPECT_EQ(out.width, 24U);
    EXPECT_EQ(out.height, 16U);
}

TEST(JxlCodecTest, FullQualityIsLossless) {
    const JxlCodec codec;
    const Raster in = test::make_raster(12, 12);
    const Raster out = codec.decode(codec.encode(in, job_for(ImageFormat::JpegXl, 100, 10)));
    EXPECT_EQ(out.pixels, in.pixels);
}

TEST(AvifCodecTest, EncodesAndDecodes) {
    const AvifCodec codec;
    const Raster in = test::make_raster(32, 18);
    const auto bytes = codec.encode(in, job_for(ImageFormat::Avif, 30, 10));
    EXPECT_EQ(sniff_image_format(bytes), ImageFormat::Avif);
    const Raster out = codec.decode(bytes);
    EXPECT_EQ(out.width, 32U);
    EXPECT_EQ(out.height, 18U);
}

TEST(CodecRegistryTest, EveryFormatHasACodec) {
    const CodecRegistry registry;
    for (const auto fmt : {ImageFormat::Avif, ImageFormat::Webp, ImageFormat::Png,
                           ImageFormat::Jpeg, ImageFormat::JpegXl}) {
        const IImageCodec* codec = registry.find(fmt);
        ASSERT_NE(codec, nullptr);
        EXPECT_EQ(codec->format(), fmt);
    }
    EXPECT_EQ(registry.find(ImageFormat::Unknown), nullptr);
    EXPECT_EQ(registry.all().size(), 5U);
}

TEST(CodecRegistryTest, TranscodeDetectsTheSource) {
    const CodecRegistry registry;
    const auto png = test::make_png(10, 6);
    const auto jpeg = registry.transcode(png, job_for(ImageFormat::Jpeg, 70));
    EXPECT_EQ(CodecRegistry::detect(jpeg), ImageFormat::Jpeg);

    const auto back = registry.transcode(jpeg, job_for(ImageFormat::Png));
    const Raster r = registry.find(ImageFormat::Png)->decode(back);
    EXPECT_EQ(r.width, 10U);
    EXPECT_EQ(r.height, 6U);
}

TEST(CodecRegistryTest, NonImageIsRejected) {
    const CodecRegistry registry;
    EXPECT_EQ(CodecRegistry::detect(test::bytes_of("plain text page")), ImageFormat::Unknown);
    EXPECT_THROW((void)registry.transcode(test::bytes_of("plain text page"), job_for(ImageFormat::Png)),
                 std::runtime_error);
}
