#include "../../include/random_utils.hpp"

#include <algorithm>
#include <random>
#include <unistd.h>

namespace {

std::mt19937_64& generator() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

} // namespace

std::uint64_t RandomUtils::next_u64() {
    return generator()();
}

std::string RandomUtils::random_suffix(const std::size_t hex_digits) {
    static constexpr char kHex[] = "0123456789abcdef";
    const std::size_t n = std::clamp<std::size_t>(hex_digits, 1, 16);

    std::string out = std::to_string(::getpid()) + "-";
    std::uint64_t bits = next_u64();
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(kHex[bits & 0xF]);
        bits >>= 4;
    }
    return out;
}
