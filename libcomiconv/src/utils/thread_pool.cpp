#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    work_cv_.notify_all();
    // jthread destructors request stop and join
    workers_.clear();
}

ThreadPool::Task ThreadPool::next_task(const std::stop_token& st) {
    std::unique_lock lock(queue_mutex_);
    work_cv_.wait(lock, st, [this] { return stop_ || !tasks_.empty(); });
    // a stopping pool still drains its queue unless the stop came from request_stop()
    if (st.stop_requested() || tasks_.empty()) {
        return {};
    }
    Task task = std::move(tasks_.front());
    tasks_.pop();
    return task;
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    while (Task task = next_task(st)) {
        try {
            task(st);
        } catch (const std::exception& e) {
            // packaged_task stores exceptions in the future, this only catches wrapper failures
            Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(),
                        "thread_pool");
        }
    }
}

std::size_t ThreadPool::request_stop() {
    std::size_t discarded = 0;
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
        discarded = tasks_.size();
        tasks_ = {};
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    return discarded;
}
