#include <gtest/gtest.h>
#include "../libcomiconv/include/container_kind.hpp"
#include "../libcomiconv/include/image_format.hpp"
#include "test_helpers.hpp"

using namespace comiconv;

TEST(ImageFormatTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_image_format("AVIF"), ImageFormat::Avif);
    EXPECT_EQ(parse_image_format("jpg"), ImageFormat::Jpeg);
    EXPECT_EQ(parse_image_format("Jpeg"), ImageFormat::Jpeg);
    EXPECT_EQ(parse_image_format("jxl"), ImageFormat::JpegXl);
    EXPECT_EQ(parse_image_format("webp"), ImageFormat::Webp);
    EXPECT_EQ(parse_image_format("png"), ImageFormat::Png);
    EXPECT_FALSE(parse_image_format("gif").has_value());
    EXPECT_FALSE(parse_image_format("").has_value());
}

TEST(ImageFormatTest, Extensions) {
    EXPECT_EQ(image_format_extension(ImageFormat::Avif), "avif");
    EXPECT_EQ(image_format_extension(ImageFormat::Jpeg), "jpg");
    EXPECT_EQ(image_format_extension(ImageFormat::JpegXl), "jxl");
    EXPECT_EQ(image_format_extension(ImageFormat::Webp), "webp");
    EXPECT_EQ(image_format_extension(ImageFormat::Png), "png");
}

TEST(ImageFormatTest, SniffsSignatures) {
    EXPECT_EQ(sniff_image_format(test::make_png()), ImageFormat::Png);

    const std::vector<std::uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xE0, 0, 0x10};
    EXPECT_EQ(sniff_image_format(jpeg), ImageFormat::Jpeg);

    const auto webp = test::bytes_of("RIFF\x10\0\0\0WEBPVP8L");
    EXPECT_EQ(sniff_image_format(webp), ImageFormat::Webp);

    const std::vector<std::uint8_t> avif = {0, 0, 0, 0x1C, 'f', 't', 'y', 'p', 'a', 'v', 'i', 'f'};
    EXPECT_EQ(sniff_image_format(avif), ImageFormat::Avif);

    const std::vector<std::uint8_t> jxl = {0xFF, 0x0A, 0x00};
    EXPECT_EQ(sniff_image_format(jxl), ImageFormat::JpegXl);
}

TEST(ImageFormatTest, SniffIgnoresShortOrForeignData) {
    EXPECT_EQ(sniff_image_format({}), ImageFormat::Unknown);
    EXPECT_EQ(sniff_image_format(test::bytes_of("hello world")), ImageFormat::Unknown);
    const std::vector<std::uint8_t> truncated_png = {0x89, 'P', 'N'};
    EXPECT_EQ(sniff_image_format(truncated_png), ImageFormat::Unknown);
}

TEST(ContainerKindTest, ParsesNamesAndComicExtensions) {
    EXPECT_EQ(parse_container_kind("zip"), ContainerKind::Zip);
    EXPECT_EQ(parse_container_kind(".cbz"), ContainerKind::Zip);
    EXPECT_EQ(parse_container_kind("CBT"), ContainerKind::Tar);
    EXPECT_EQ(parse_container_kind("7z"), ContainerKind::SevenZip);
    EXPECT_EQ(parse_container_kind("cbr"), ContainerKind::Rar);
    EXPECT_FALSE(parse_container_kind("gz").has_value());
}

TEST(ContainerKindTest, RarIsReadOnly) {
    EXPECT_TRUE(can_write_container(ContainerKind::Zip));
    EXPECT_TRUE(can_write_container(ContainerKind::Tar));
    EXPECT_TRUE(can_write_container(ContainerKind::SevenZip));
    EXPECT_FALSE(can_write_container(ContainerKind::Rar));
    EXPECT_FALSE(can_write_container(ContainerKind::Unknown));
}
