/**
 * @file comiconv.hpp
 * @brief Public API of the comiconv library.
 */

#ifndef COMICONV_HPP
#define COMICONV_HPP

#include "container_kind.hpp"
#include "conversion_job.hpp"
#include "image_format.hpp"
#include "remote_session.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace comiconv {

class EventBus;

/**
 * @brief How often a file conversion is attempted on retryable errors.
 *
 * Only IoError, InvalidResponse and HashMismatch are retried; each retry
 * starts over on a fresh connection with the same payload.
 */
struct RetryPolicy {
    unsigned max_attempts = 1;           ///< Total attempts, 1 = no retry
    std::chrono::milliseconds delay{500}; ///< Pause between attempts
};

/**
 * @brief Interface for receiving progress and status events during conversion.
 */
struct ConverterObserver {
    virtual ~ConverterObserver() = default;

    virtual void onFileStart(const std::filesystem::path& path, bool remote) {}

    virtual void onConversionStart(std::size_t entry_count) {}

    virtual void onEntryTranscoded(std::size_t index) {}

    virtual void onFileFinish(const std::filesystem::path& path,
                              uintmax_t size_before,
                              uintmax_t size_after) {}

    virtual void onFileError(const std::filesystem::path& path,
                             const std::string& error) {}

    virtual void onRetry(const std::filesystem::path& path,
                         unsigned attempt,
                         const std::string& reason) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface of the comiconv library.
 *
 * @details Converts every image of a comic book archive to one target
 * format, either locally on a worker pool or by offloading the archive to a
 * conversion server. Configuration goes through fluent setters; execution
 * is blocking. Uses the PIMPL idiom to keep codec and container headers out
 * of the public surface.
 *
 * A Converter keeps its server connection open across consecutive calls and
 * reconnects only after a failure.
 */
class Converter {
public:
    Converter();
    ~Converter();

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;
    Converter(Converter&&) noexcept;
    Converter& operator=(Converter&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Target image format.
     * Default: AVIF.
     */
    Converter& format(ImageFormat fmt);

    /**
     * @brief Quality 0..100, clamped. Ignored by lossless targets.
     * Default: 30.
     */
    Converter& quality(int val);

    /**
     * @brief Speed 0..10, clamped (0..2 for PNG).
     * Default: 3.
     */
    Converter& speed(int val);

    /**
     * @brief Worker threads for local conversions.
     * Default: hardware concurrency.
     */
    Converter& threads(unsigned val);

    /**
     * @brief Force the input container kind instead of detecting it.
     */
    Converter& containerKind(std::optional<ContainerKind> kind);

    /**
     * @brief Kind used to rebuild archives of a read-only kind.
     * Default: Zip.
     */
    Converter& fallbackContainer(ContainerKind kind);

    /**
     * @brief Keep the original file as "<file>.bak".
     * Default: false.
     */
    Converter& backup(bool val);

    /**
     * @brief Offload conversions to a server ("HOST:PORT"); an empty string
     * switches back to local conversion.
     * @throws std::invalid_argument on a malformed address.
     */
    Converter& server(const std::string& address);

    Converter& retryPolicy(RetryPolicy policy);

    [[nodiscard]] const ConversionJob& job() const noexcept;

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(ConverterObserver* observer);

    /**
     * @brief Bus on which all events of this converter are published.
     */
    [[nodiscard]] EventBus& events() noexcept;

    /**
     * @brief Counters of the last remote job, if any ran.
     */
    [[nodiscard]] std::optional<SessionStats> lastSessionStats() const;

    // --- Execution ---

    /**
     * @brief Converts archive bytes and returns the new archive.
     * @throws ConversionError subclasses; retryable errors only after the
     * retry policy is exhausted.
     */
    [[nodiscard]] std::vector<std::uint8_t> convert(std::span<const std::uint8_t> archive);

    /**
     * @brief Converts a file in place.
     *
     * The original is replaced only after the complete new archive exists; with
     * backup enabled it is renamed to "<file>.bak" first.
     * @throws ConversionError subclasses.
     */
    void convertFile(const std::filesystem::path& path);

    /**
     * @brief Converts several files, continuing after failures.
     * @return Number of files that failed.
     */
    std::size_t convertFiles(const std::vector<std::filesystem::path>& paths);

    // --- Control ---

    /**
     * @brief Requests cancellation before the next file or attempt. Thread-safe.
     */
    void stop();

    [[nodiscard]] bool stopped() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace comiconv

#endif // COMICONV_HPP
