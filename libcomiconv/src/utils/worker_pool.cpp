#include "../../include/worker_pool.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/thread_pool.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <optional>
#include <utility>

namespace comiconv {

WorkerPool::WorkerPool(TranscodeFn transcode, EventBus* bus)
    : transcode_(std::move(transcode)), bus_(bus) {}

std::vector<TranscodeResult> WorkerPool::run(const std::vector<TranscodeTask>& tasks,
                                             const ConversionJob& job) const {
    const ConversionJob normalized = job.normalized();

    std::vector<TranscodeResult> results;
    results.reserve(tasks.size());
    std::mutex results_mtx;
    std::atomic<bool> failed{false};
    std::optional<CodecError> first_error;

    {
        ThreadPool pool(normalized.thread_count);
        Logger::log(LogLevel::Debug,
                    "Transcoding " + std::to_string(tasks.size()) + " entries on " +
                    std::to_string(pool.size()) + " threads",
                    "worker_pool");

        std::vector<std::future<void>> futures;
        futures.reserve(tasks.size());
        for (const auto& task : tasks) {
            futures.push_back(pool.enqueue([&, task](const std::stop_token& st) {
                if (st.stop_requested() || failed.load(std::memory_order_relaxed)) {
                    return;
                }
                std::vector<std::uint8_t> encoded;
                try {
                    encoded = transcode_(task.raw_bytes, normalized);
                } catch (const std::exception& e) {
                    failed.store(true, std::memory_order_relaxed);
                    throw CodecError(task.index, e.what());
                }
                {
                    std::lock_guard lock(results_mtx);
                    results.push_back(TranscodeResult{task.index, std::move(encoded)});
                }
                if (bus_) bus_->publish(EntryTranscodedEvent{task.index});
            }));
        }

        for (auto& f : futures) {
            try {
                f.get();
            } catch (const CodecError& e) {
                if (!first_error) {
                    Logger::log(LogLevel::Error, e.what(), "worker_pool");
                    first_error = e;
                    const std::size_t dropped = pool.request_stop();
                    Logger::log(LogLevel::Debug, "Discarded " + std::to_string(dropped) + " queued entries",
                                "worker_pool");
                }
            } catch (const std::future_error&) {
                // queued task discarded by request_stop()
                if (!first_error) throw;
            }
        }
    } // workers joined here

    if (first_error) {
        throw *first_error;
    }
    return results;
}

} // namespace comiconv
