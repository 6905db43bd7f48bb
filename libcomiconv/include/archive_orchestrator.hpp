/**
 * @file archive_orchestrator.hpp
 * @brief Local conversion of a whole archive.
 *
 * The ArchiveOrchestrator enumerates the entries of an archive, hands every
 * File entry to a WorkerPool and rebuilds the archive in the original order
 * once all results are in.
 */

#ifndef COMICONV_ARCHIVE_ORCHESTRATOR_HPP
#define COMICONV_ARCHIVE_ORCHESTRATOR_HPP

#include "archive_container.hpp"
#include "conversion_job.hpp"
#include "worker_pool.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace comiconv {

class EventBus;

/**
 * @brief Replaces the extension of the last path component.
 *
 * "a/b/page.png" -> "a/b/page.avif"; a name without an extension gets one
 * appended. Dots in directory names are left alone.
 */
std::string replace_extension(const std::string& entry_path, const std::string& extension);

/**
 * @brief Puts encoded results back on the File entries they came from and
 * renames those entries to `extension`.
 *
 * Results are matched by index, never by completion order.
 * @throws ConsistencyError for a result naming a non-File or out-of-range
 * entry, a second result for one entry, or a File entry left without one.
 * `entries` is unchanged when it throws.
 */
void correlate_results(std::vector<ArchiveEntry>& entries, std::vector<TranscodeResult> results,
                       const std::string& extension);

/**
 * @brief Converts all images of an archive held in memory.
 *
 * @details Phases of convert():
 * - read the container (auto-detected or declared kind);
 * - publish ConversionStartEvent with the number of File entries;
 * - transcode all File entries through the WorkerPool;
 * - check that results correlate one-to-one with the submitted indices;
 * - rebuild in the original order with renamed File entries and
 * directory records re-emitted as read.
 *
 * Nothing is written to disk; an exception leaves no partial output.
 */
class ArchiveOrchestrator {
public:
    /**
     * @param transcode Per-image transformation run on the workers.
     * @param bus Optional bus for ConversionStartEvent and EntryTranscodedEvent.
     */
    explicit ArchiveOrchestrator(TranscodeFn transcode, EventBus* bus = nullptr);

    /**
     * @brief Kind used for rebuilding archives read from a read-only kind (RAR).
     * Defaults to Zip.
     */
    void set_fallback_container(ContainerKind kind) { fallback_ = kind; }

    [[nodiscard]] ContainerKind fallback_container() const noexcept { return fallback_; }

    /**
     * @brief Convert an archive.
     *
     * @param archive The archive bytes.
     * @param job Target format, quality, speed, threads.
     * @param declared Container kind forced by the caller; auto-detected if empty.
     * @return The rebuilt archive.
     * @throws UnsupportedContainer, CodecError, ConsistencyError
     */
    [[nodiscard]] std::vector<std::uint8_t> convert(std::span<const std::uint8_t> archive,
                                                    const ConversionJob& job,
                                                    std::optional<ContainerKind> declared = std::nullopt);

    /**
     * @brief Kind the last call to convert() wrote, Unknown before the first call.
     */
    [[nodiscard]] ContainerKind last_output_kind() const noexcept { return last_output_kind_; }

private:
    TranscodeFn transcode_;
    EventBus* bus_;
    ContainerKind fallback_ = ContainerKind::Zip;
    ContainerKind last_output_kind_ = ContainerKind::Unknown;
};

} // namespace comiconv

#endif // COMICONV_ARCHIVE_ORCHESTRATOR_HPP
