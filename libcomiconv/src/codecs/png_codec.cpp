#include "../../include/png_codec.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace comiconv {

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     */
    [[noreturn]] void png_error_fn(png_structp, const png_const_charp msg) {
        throw std::runtime_error(std::string("libpng: ") + msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "png_codec");
    }

    /**
     * @brief RAII wrapper for libpng read structs.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    struct MemoryReader {
        std::span<const std::uint8_t> data;
        std::size_t offset = 0;
    };

    void read_from_memory(png_structp png, png_bytep out, const png_size_t length) {
        auto* src = static_cast<MemoryReader*>(png_get_io_ptr(png));
        if (src->data.size() - src->offset < length) {
            png_error(png, "unexpected end of PNG data");
        }
        std::memcpy(out, src->data.data() + src->offset, length);
        src->offset += length;
    }

    void write_to_memory(png_structp png, png_bytep in, const png_size_t length) {
        auto* dst = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
        dst->insert(dst->end(), in, in + length);
    }

    void flush_memory(png_structp) {}

} // namespace

Raster PngCodec::decode(std::span<const std::uint8_t> data) const {
    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

    MemoryReader reader{data, 0};
    png_set_read_fn(rd.png, &reader, read_from_memory);
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    // normalise everything to 8-bit RGB or RGBA
    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    const bool trns = png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
    if (trns) png_set_tRNS_to_alpha(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(rd.png);
    png_set_interlace_handling(rd.png);
    png_read_update_info(rd.png, rd.info);

    Raster img;
    img.width = width;
    img.height = height;
    img.channels = png_get_channels(rd.png, rd.info);
    if (img.channels != 3 && img.channels != 4) {
        throw std::runtime_error("unexpected PNG channel count " + std::to_string(img.channels));
    }
    img.pixels.resize(img.stride() * height);

    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = img.pixels.data() + y * img.stride();
    }
    png_read_image(rd.png, rows.data());
    png_read_end(rd.png, nullptr);
    return img;
}

std::vector<std::uint8_t> PngCodec::encode(const Raster& image, const ConversionJob& job) const {
    std::vector<std::uint8_t> out;

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw std::runtime_error("png_create_info_struct failed");

    png_set_write_fn(wr.png, &out, write_to_memory, flush_memory);

    const int level = png_zlib_level(job.speed);
    png_set_compression_level(wr.png, level);
    png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
    if (level == Z_BEST_SPEED) {
        png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_FILTER_NONE);
    }

    png_set_IHDR(wr.png, wr.info, image.width, image.height, 8,
                 image.has_alpha() ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(wr.png, wr.info);

    std::vector<png_bytep> rows(image.height);
    for (std::uint32_t y = 0; y < image.height; ++y) {
        rows[y] = const_cast<png_bytep>(image.pixels.data() + y * image.stride());
    }
    png_write_image(wr.png, rows.data());
    png_write_end(wr.png, nullptr);
    return out;
}

} // namespace comiconv
