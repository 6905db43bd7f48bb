/**
 * @file worker_pool.hpp
 * @brief Parallel transcoding of archive entries.
 */

#ifndef COMICONV_WORKER_POOL_HPP
#define COMICONV_WORKER_POOL_HPP

#include "conversion_job.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace comiconv {

class EventBus;

/**
 * @brief One unit of work: the raw bytes of the File entry at `index`.
 *
 * The bytes are borrowed and must outlive WorkerPool::run.
 */
struct TranscodeTask {
    std::size_t index = 0;
    std::span<const std::uint8_t> raw_bytes;
};

/**
 * @brief The encoded bytes produced for the task with the same index.
 */
struct TranscodeResult {
    std::size_t index = 0;
    std::vector<std::uint8_t> encoded_bytes;
};

/// Decode + encode of one image. Must be safe to call from several threads.
using TranscodeFn = std::function<std::vector<std::uint8_t>(std::span<const std::uint8_t>, const ConversionJob&)>;

/**
 * @brief Runs a batch of TranscodeTasks on a fixed number of threads.
 *
 * @details Each run() creates its own ThreadPool with job.thread_count
 * workers and destroys it before returning, so no worker outlives the
 * batch. Results are returned in completion order; callers correlate them
 * by index.
 *
 * The first failing task turns into a CodecError carrying its index. Tasks
 * that have not started yet are dropped and the error is rethrown once all
 * running tasks have finished.
 */
class WorkerPool {
public:
    /**
     * @param transcode The per-image transformation.
     * @param bus Optional bus receiving one EntryTranscodedEvent per finished task.
     */
    explicit WorkerPool(TranscodeFn transcode, EventBus* bus = nullptr);

    /**
     * @brief Transcode every task.
     * @throws CodecError if any task fails.
     */
    [[nodiscard]] std::vector<TranscodeResult> run(const std::vector<TranscodeTask>& tasks,
                                                   const ConversionJob& job) const;

private:
    TranscodeFn transcode_;
    EventBus* bus_;
};

} // namespace comiconv

#endif // COMICONV_WORKER_POOL_HPP
