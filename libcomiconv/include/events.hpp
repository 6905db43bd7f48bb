#ifndef COMICONV_EVENTS_HPP
#define COMICONV_EVENTS_HPP

#include <filesystem>
#include <string>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace comiconv {

/**
 * @brief Events published while converting a file.
 *
 * Plain data carriers used with EventBus. Local and remote conversions
 * publish the same entry-level events, so a subscriber does not need to know
 * where the transcoding happens.
 */

// --- File level ---

/**
 * @brief Emitted when conversion of an input file begins.
 */
struct FileConvertStartEvent {
    std::filesystem::path path; ///< Input file
    bool remote = false;        ///< True if the work is offloaded to a server
};

/**
 * @brief Emitted when a file was converted and written back.
 */
struct FileConvertCompleteEvent {
    std::filesystem::path path;            ///< Input file
    uintmax_t original_size = 0;           ///< Size of the original archive
    uintmax_t new_size = 0;                ///< Size of the rebuilt archive
    std::chrono::milliseconds duration{0}; ///< Wall time of the conversion
};

/**
 * @brief Emitted when conversion of a file failed for good.
 */
struct FileConvertErrorEvent {
    std::filesystem::path path; ///< Input file
    std::string error_message;  ///< Error description
};

/**
 * @brief Emitted before another attempt of a retryable failure.
 */
struct RetryEvent {
    std::filesystem::path path; ///< Input file
    unsigned attempt = 0;       ///< Attempt about to start (2 for the first retry)
    std::string reason;         ///< Error that caused the retry
};

// --- Entry level ---

/**
 * @brief Emitted once per run, before any entry is transcoded.
 */
struct ConversionStartEvent {
    std::size_t file_count = 0; ///< Number of file entries that will be transcoded
};

/**
 * @brief Emitted exactly once for every transcoded file entry.
 *
 * Order across entries is unspecified. For remote conversions the index is
 * the ordinal of the progress token, since the server does not name entries.
 */
struct EntryTranscodedEvent {
    std::size_t index = 0;
};

// --- Transfer ---

struct UploadProgressEvent {
    std::uint64_t sent = 0;
    std::uint64_t total = 0;
};

struct DownloadProgressEvent {
    std::uint64_t received = 0;
    std::uint64_t total = 0;
};

} // namespace comiconv

#endif // COMICONV_EVENTS_HPP
