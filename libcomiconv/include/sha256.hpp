/**
 * @file sha256.hpp
 * @brief SHA-256 wrappers over OpenSSL's EVP interface.
 *
 * The digest is used purely to verify that payloads crossed the wire intact;
 * it is not an authentication mechanism.
 */

#ifndef COMICONV_SHA256_HPP
#define COMICONV_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

// forward declaration, keeps <openssl/evp.h> out of the public headers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace comiconv {

inline constexpr std::size_t kDigestSize = 32;

using Digest = std::array<std::uint8_t, kDigestSize>;

/**
 * @brief Streaming SHA-256 hasher.
 *
 * Feed chunks with update() as they are sent or received; digest() may be
 * called once the stream is complete.
 */
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    void reset();
    void update(std::span<const std::uint8_t> data);
    [[nodiscard]] Digest digest();

private:
    EVP_MD_CTX* ctx_;
};

/**
 * @brief One-shot SHA-256 of a buffer.
 */
Digest sha256(std::span<const std::uint8_t> data);

/**
 * @brief Lowercase hexadecimal rendering of a digest, for logs.
 */
std::string to_hex(const Digest& digest);

} // namespace comiconv

#endif // COMICONV_SHA256_HPP
