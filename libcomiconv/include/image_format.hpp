/**
 * @file image_format.hpp
 * @brief Central enumeration of the image formats comiconv reads and writes.
 *
 * Provides conversions between the enum, file extensions, MIME types and
 * user-facing names, plus the content sniffer used to pick a decoder.
 */

#ifndef COMICONV_IMAGE_FORMAT_HPP
#define COMICONV_IMAGE_FORMAT_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace comiconv {

/**
 * @brief Image formats known to the codec layer.
 *
 * All five can be decoded and encoded locally. Only the first four have a
 * code on the remote wire protocol.
 */
enum class ImageFormat {
    Avif,
    Webp,
    Png,
    Jpeg,
    JpegXl,
    Unknown
};

///< Map linking MIME types reported by libmagic to image formats.
inline const std::unordered_map<std::string, ImageFormat> mime_to_image_format = {
    { "image/png",  ImageFormat::Png },
    { "image/jpeg", ImageFormat::Jpeg },
    { "image/webp", ImageFormat::Webp },
    { "image/jxl",  ImageFormat::JpegXl },
    { "image/avif", ImageFormat::Avif },
    { "image/heif", ImageFormat::Avif },
};

/**
 * @brief File extension (without dot) written for a target format.
 */
inline std::string image_format_extension(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Avif:   return "avif";
        case ImageFormat::Webp:   return "webp";
        case ImageFormat::Png:    return "png";
        case ImageFormat::Jpeg:   return "jpg";
        case ImageFormat::JpegXl: return "jxl";
        default:                  return "unknown";
    }
}

/**
 * @brief Parses a user-supplied format name. Case-insensitive.
 * @return The format, or std::nullopt for unknown names.
 */
inline std::optional<ImageFormat> parse_image_format(const std::string& str) {
    std::string s = str;
    std::ranges::transform(s, s.begin(),
        [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    if (s == "avif")                return ImageFormat::Avif;
    if (s == "jpeg" || s == "jpg")  return ImageFormat::Jpeg;
    if (s == "jxl")                 return ImageFormat::JpegXl;
    if (s == "webp")                return ImageFormat::Webp;
    if (s == "png")                 return ImageFormat::Png;
    return std::nullopt;
}

/**
 * @brief Identifies an image from its leading bytes.
 *
 * Only signatures are inspected; the entry name plays no part.
 * @return The detected format or ImageFormat::Unknown.
 */
inline ImageFormat sniff_image_format(std::span<const std::uint8_t> data) {
    auto starts_with = [&](std::size_t offset, std::initializer_list<std::uint8_t> sig) {
        if (data.size() < offset + sig.size()) return false;
        return std::equal(sig.begin(), sig.end(), data.begin() + static_cast<std::ptrdiff_t>(offset));
    };

    if (starts_with(0, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return ImageFormat::Png;
    if (starts_with(0, {0xFF, 0xD8, 0xFF}))                             return ImageFormat::Jpeg;
    if (starts_with(0, {'R', 'I', 'F', 'F'}) && starts_with(8, {'W', 'E', 'B', 'P'})) return ImageFormat::Webp;
    // naked codestream and ISOBMFF container
    if (starts_with(0, {0xFF, 0x0A}))                                   return ImageFormat::JpegXl;
    if (starts_with(0, {0x00, 0x00, 0x00, 0x0C, 'J', 'X', 'L', ' ', 0x0D, 0x0A, 0x87, 0x0A})) return ImageFormat::JpegXl;
    if (starts_with(4, {'f', 't', 'y', 'p'})) {
        if (starts_with(8, {'a', 'v', 'i', 'f'}) || starts_with(8, {'a', 'v', 'i', 's'})) return ImageFormat::Avif;
    }
    return ImageFormat::Unknown;
}

} // namespace comiconv

#endif // COMICONV_IMAGE_FORMAT_HPP
