#ifndef COMICONV_MIME_DETECTOR_HPP
#define COMICONV_MIME_DETECTOR_HPP

#include <cstdint>
#include <span>
#include <string>

namespace comiconv {

    /**
     * @brief Content-based MIME type detection.
     *
     * Used as the fallback when the built-in signatures of the image and
     * container layers do not recognise a byte stream.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @param data The bytes to inspect.
         * @return A MIME type, or an empty string if detection is unavailable.
         */
        static std::string detect(std::span<const std::uint8_t> data);
    };

} // namespace comiconv

#endif // COMICONV_MIME_DETECTOR_HPP
