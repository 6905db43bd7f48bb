/**
 * @file thread_pool.hpp
 * @brief Defines a simple fixed-size, thread-safe thread pool.
 *
 * Used by WorkerPool to bound codec concurrency.
 */

#ifndef COMICONV_THREAD_POOL_HPP
#define COMICONV_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

/**
 * @brief A fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread, so destroying the pool requests stop and
 * joins every worker: once the destructor returns no task is running.
 * Tasks accept a `std::stop_token` and should check it before starting
 * expensive work.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads Number of workers. Zero means one.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Requests stop and joins all worker threads.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task to be executed by a worker thread.
     *
     * @tparam F Callable accepting a `std::stop_token`.
     * @param f The task to execute.
     * @return A std::future carrying the task's result or exception.
     * @throws std::runtime_error if enqueue is called on a stopped pool.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::lock_guard lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        work_cv_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Requests all worker threads to stop and clears the task queue.
     *
     * Queued tasks are discarded; their futures report broken_promise.
     * Running tasks observe the request through their stop_token.
     * @return Number of queued tasks that were discarded.
     */
    std::size_t request_stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    using Task = std::function<void(std::stop_token)>;

    void worker_loop(const std::stop_token& st);

    /// Pops the next task, or returns an empty Task once the worker must exit.
    Task next_task(const std::stop_token& st);

    std::mutex queue_mutex_;                ///< Protects tasks_ and stop_
    std::condition_variable_any work_cv_;   ///< Notifies workers of new tasks or stop requests
    std::queue<Task> tasks_;
    bool stop_{false};
    std::vector<std::jthread> workers_;
};

#endif // COMICONV_THREAD_POOL_HPP
