#include "../../include/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace comiconv {

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    reset();
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Sha256Hasher::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

void Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Digest Sha256Hasher::digest() {
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return out;
}

Digest sha256(std::span<const std::uint8_t> data) {
    Sha256Hasher hasher;
    hasher.update(data);
    return hasher.digest();
}

std::string to_hex(const Digest& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string s;
    s.reserve(digest.size() * 2);
    for (const auto b : digest) {
        s.push_back(kHex[b >> 4]);
        s.push_back(kHex[b & 0x0F]);
    }
    return s;
}

} // namespace comiconv
