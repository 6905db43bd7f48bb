/**
 * @file errors.hpp
 * @brief Exception types thrown by comiconv.
 *
 * Every failure surfaces as a subclass of ConversionError. The distinction
 * matters to callers deciding whether to retry: protocol and I/O failures
 * can be retried over a fresh connection, container and codec failures
 * cannot.
 */

#ifndef COMICONV_ERRORS_HPP
#define COMICONV_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace comiconv {

/**
 * @brief Base class of all comiconv errors.
 */
class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @return true if restarting the whole file conversion may succeed.
    [[nodiscard]] virtual bool retryable() const noexcept { return false; }
};

/**
 * @brief The archive is not one of the supported container kinds, is
 * corrupted, or cannot be written back.
 */
class UnsupportedContainer final : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/**
 * @brief Decoding or encoding of one archive entry failed.
 */
class CodecError final : public ConversionError {
public:
    CodecError(std::size_t index, const std::string& cause)
        : ConversionError("entry " + std::to_string(index) + ": " + cause),
          index_(index), cause_(cause) {}

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] const std::string& cause() const noexcept { return cause_; }

private:
    std::size_t index_;
    std::string cause_;
};

/**
 * @brief Local file or socket I/O failed.
 */
class IoError final : public ConversionError {
public:
    using ConversionError::ConversionError;
    [[nodiscard]] bool retryable() const noexcept override { return true; }
};

/**
 * @brief The remote peer violated the wire protocol (or timed out during
 * the handshake).
 */
class InvalidResponse final : public ConversionError {
public:
    InvalidResponse() : ConversionError("Invalid server response") {}
    explicit InvalidResponse(const std::string& what)
        : ConversionError("Invalid server response: " + what) {}
    [[nodiscard]] bool retryable() const noexcept override { return true; }
};

/**
 * @brief The downloaded result does not match the digest announced by the peer.
 */
class HashMismatch final : public ConversionError {
public:
    HashMismatch() : ConversionError("Hash mismatch") {}
    [[nodiscard]] bool retryable() const noexcept override { return true; }
};

/**
 * @brief The requested target format cannot be produced by this path
 * (e.g. JPEG XL over the remote protocol).
 */
class UnsupportedFormat final : public ConversionError {
public:
    using ConversionError::ConversionError;
};

/**
 * @brief Results did not correlate one-to-one with submitted entries.
 */
class ConsistencyError final : public ConversionError {
public:
    using ConversionError::ConversionError;
};

} // namespace comiconv

#endif // COMICONV_ERRORS_HPP
