#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace comiconv {

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 */
[[noreturn]] void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(std::string("libjpeg: ") + err->msg);
}

void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "jpeg_codec");
}

/**
 * @brief Owns a jpeg_decompress_struct.
 */
struct JpegDecompress {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr err{};

    JpegDecompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_decompress(&cinfo);
    }
    ~JpegDecompress() { jpeg_destroy_decompress(&cinfo); }
};

/**
 * @brief Owns a jpeg_compress_struct and the buffer jpeg_mem_dest allocates.
 */
struct JpegCompress {
    jpeg_compress_struct cinfo{};
    JpegErrorMgr err{};
    unsigned char* mem = nullptr;
    unsigned long mem_size = 0;

    JpegCompress() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = jpeg_error_exit_throw;
        err.pub.output_message = jpeg_output_message_log;
        jpeg_create_compress(&cinfo);
    }
    ~JpegCompress() {
        jpeg_destroy_compress(&cinfo);
        std::free(mem);
    }
};

} // namespace

Raster JpegCodec::decode(std::span<const std::uint8_t> data) const {
    JpegDecompress d;
    jpeg_mem_src(&d.cinfo, data.data(), static_cast<unsigned long>(data.size()));

    if (jpeg_read_header(&d.cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }
    // grayscale and YCbCr alike come out as RGB
    d.cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&d.cinfo);

    Raster img;
    img.width = d.cinfo.output_width;
    img.height = d.cinfo.output_height;
    img.channels = static_cast<std::uint32_t>(d.cinfo.output_components);
    if (img.channels != 3) {
        throw std::runtime_error("unexpected JPEG component count " + std::to_string(img.channels));
    }
    img.pixels.resize(img.stride() * img.height);

    while (d.cinfo.output_scanline < d.cinfo.output_height) {
        JSAMPROW row = img.pixels.data() + static_cast<std::size_t>(d.cinfo.output_scanline) * img.stride();
        jpeg_read_scanlines(&d.cinfo, &row, 1);
    }
    jpeg_finish_decompress(&d.cinfo);
    return img;
}

std::vector<std::uint8_t> JpegCodec::encode(const Raster& image, const ConversionJob& job) const {
    JpegCompress c;
    jpeg_mem_dest(&c.cinfo, &c.mem, &c.mem_size);

    c.cinfo.image_width = image.width;
    c.cinfo.image_height = image.height;
    c.cinfo.input_components = 3;
    c.cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&c.cinfo);
    jpeg_set_quality(&c.cinfo, job.quality, TRUE);
    c.cinfo.optimize_coding = TRUE;

    jpeg_start_compress(&c.cinfo, TRUE);

    std::vector<std::uint8_t> rgb_row(static_cast<std::size_t>(image.width) * 3);
    while (c.cinfo.next_scanline < c.cinfo.image_height) {
        const std::uint8_t* src = image.pixels.data() + static_cast<std::size_t>(c.cinfo.next_scanline) * image.stride();
        JSAMPROW row;
        if (image.has_alpha()) {
            // drop alpha
            for (std::uint32_t x = 0; x < image.width; ++x) {
                rgb_row[x * 3 + 0] = src[x * 4 + 0];
                rgb_row[x * 3 + 1] = src[x * 4 + 1];
                rgb_row[x * 3 + 2] = src[x * 4 + 2];
            }
            row = rgb_row.data();
        } else {
            row = const_cast<JSAMPROW>(src);
        }
        jpeg_write_scanlines(&c.cinfo, &row, 1);
    }
    jpeg_finish_compress(&c.cinfo);

    return {c.mem, c.mem + c.mem_size};
}

} // namespace comiconv
