/**
 * @file wire_protocol.hpp
 * @brief Constants and encoders of the remote conversion wire protocol.
 *
 * Exchange on one TCP connection, all integers big-endian:
 *
 *   C->S "comi"                         handshake
 *   S->C "conv"
 *   C->S [fmt][speed][quality][0][len]  8-byte job header
 *   C->S sha256(payload)                32 bytes
 *   C->S payload, <= 1 MiB per chunk    each chunk acknowledged by S->C "ok"
 *   S->C entry_count                    u32
 *   S->C "plus" x entry_count           one per converted entry
 *   S->C result_len                     u32
 *   S->C sha256(result)                 32 bytes
 *   S->C result                         result_len bytes, no acks
 */

#ifndef COMICONV_WIRE_PROTOCOL_HPP
#define COMICONV_WIRE_PROTOCOL_HPP

#include "image_format.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace comiconv::wire {

inline constexpr std::array<std::uint8_t, 4> kClientMagic  = {'c', 'o', 'm', 'i'};
inline constexpr std::array<std::uint8_t, 4> kServerMagic  = {'c', 'o', 'n', 'v'};
inline constexpr std::array<std::uint8_t, 2> kChunkAck     = {'o', 'k'};
inline constexpr std::array<std::uint8_t, 4> kProgressToken = {'p', 'l', 'u', 's'};

inline constexpr std::size_t kJobHeaderSize = 8;
inline constexpr std::size_t kMaxChunkSize = 1024 * 1024;
inline constexpr std::chrono::seconds kReadTimeout{10};

/**
 * @brief One-byte wire code of a target format.
 * @return The code, or std::nullopt for formats the protocol cannot carry
 * (JPEG XL).
 */
inline std::optional<std::uint8_t> format_code(const ImageFormat fmt) {
    switch (fmt) {
        case ImageFormat::Avif: return static_cast<std::uint8_t>('A');
        case ImageFormat::Webp: return static_cast<std::uint8_t>('W');
        case ImageFormat::Png:  return static_cast<std::uint8_t>('P');
        case ImageFormat::Jpeg: return static_cast<std::uint8_t>('J');
        default:                return std::nullopt;
    }
}

/**
 * @brief Inverse of format_code.
 */
inline ImageFormat format_from_code(const std::uint8_t code) {
    switch (code) {
        case 'A': return ImageFormat::Avif;
        case 'W': return ImageFormat::Webp;
        case 'P': return ImageFormat::Png;
        case 'J': return ImageFormat::Jpeg;
        default:  return ImageFormat::Unknown;
    }
}

inline void put_u32_be(const std::uint32_t v, std::uint8_t* out) {
    out[0] = static_cast<std::uint8_t>(v >> 24);
    out[1] = static_cast<std::uint8_t>(v >> 16);
    out[2] = static_cast<std::uint8_t>(v >> 8);
    out[3] = static_cast<std::uint8_t>(v);
}

inline std::uint32_t get_u32_be(const std::uint8_t* in) {
    return (static_cast<std::uint32_t>(in[0]) << 24) |
           (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8)  |
           (static_cast<std::uint32_t>(in[3]));
}

/**
 * @brief The 8-byte job header sent after the handshake.
 */
struct JobHeader {
    std::uint8_t format = 0;
    std::uint8_t speed = 0;
    std::uint8_t quality = 0;
    std::uint32_t payload_len = 0;
};

inline std::array<std::uint8_t, kJobHeaderSize> encode_job_header(const JobHeader& h) {
    std::array<std::uint8_t, kJobHeaderSize> buf{};
    buf[0] = h.format;
    buf[1] = h.speed;
    buf[2] = h.quality;
    buf[3] = 0; // reserved
    put_u32_be(h.payload_len, buf.data() + 4);
    return buf;
}

} // namespace comiconv::wire

#endif // COMICONV_WIRE_PROTOCOL_HPP
