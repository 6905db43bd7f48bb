#include <gtest/gtest.h>
#include "../libcomiconv/include/errors.hpp"
#include "../libcomiconv/include/event_bus.hpp"
#include "../libcomiconv/include/events.hpp"
#include "../libcomiconv/include/worker_pool.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>

using namespace comiconv;

namespace {

std::vector<std::vector<std::uint8_t>> make_inputs(const std::size_t n) {
    std::vector<std::vector<std::uint8_t>> inputs;
    for (std::size_t i = 0; i < n; ++i) {
        inputs.push_back(std::vector<std::uint8_t>(i + 1, static_cast<std::uint8_t>(i)));
    }
    return inputs;
}

std::vector<TranscodeTask> make_tasks(const std::vector<std::vector<std::uint8_t>>& inputs) {
    std::vector<TranscodeTask> tasks;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        // sparse indices, as when directories sit between files
        tasks.push_back(TranscodeTask{i * 2 + 1, inputs[i]});
    }
    return tasks;
}

} // namespace

TEST(WorkerPoolTest, EveryTaskYieldsOneResultWithItsIndex) {
    const auto inputs = make_inputs(40);
    const auto tasks = make_tasks(inputs);

    const WorkerPool pool([](std::span<const std::uint8_t> in, const ConversionJob&) {
        // reversed bytes, so the output depends on the input
        return std::vector<std::uint8_t>(in.rbegin(), in.rend());
    });

    ConversionJob job;
    job.thread_count = 4;
    const auto results = pool.run(tasks, job);

    ASSERT_EQ(results.size(), tasks.size());
    std::set<std::size_t> seen;
    for (const auto& r : results) {
        EXPECT_TRUE(seen.insert(r.index).second) << "duplicate index " << r.index;
        const std::size_t i = (r.index - 1) / 2;
        ASSERT_LT(i, inputs.size());
        EXPECT_EQ(r.encoded_bytes.size(), inputs[i].size());
    }
}

TEST(WorkerPoolTest, PublishesOneEventPerEntry) {
    const auto inputs = make_inputs(10);
    const auto tasks = make_tasks(inputs);

    EventBus bus;
    std::mutex mtx;
    std::vector<std::size_t> indices;
    bus.subscribe<EntryTranscodedEvent>([&](const EntryTranscodedEvent& e) {
        std::lock_guard lock(mtx);
        indices.push_back(e.index);
    });

    const WorkerPool pool([](std::span<const std::uint8_t> in, const ConversionJob&) {
        return std::vector<std::uint8_t>(in.begin(), in.end());
    }, &bus);
    ConversionJob job;
    job.thread_count = 3;
    (void)pool.run(tasks, job);

    std::ranges::sort(indices);
    ASSERT_EQ(indices.size(), tasks.size());
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        EXPECT_EQ(indices[i], tasks[i].index);
    }
}

TEST(WorkerPoolTest, FailingEntryAbortsWithCodecError) {
    const auto inputs = make_inputs(50);
    const auto tasks = make_tasks(inputs);
    std::atomic<int> calls{0};

    const WorkerPool pool([&calls](std::span<const std::uint8_t> in, const ConversionJob&) {
        ++calls;
        if (in.size() == 6) { // task index 11
            throw std::runtime_error("corrupt image");
        }
        return std::vector<std::uint8_t>(in.begin(), in.end());
    });

    ConversionJob job;
    job.thread_count = 2;
    try {
        (void)pool.run(tasks, job);
        FAIL() << "expected CodecError";
    } catch (const CodecError& e) {
        EXPECT_EQ(e.index(), 11U);
        EXPECT_EQ(e.cause(), "corrupt image");
        EXPECT_FALSE(e.retryable());
    }
    EXPECT_LE(calls.load(), 50);
}

TEST(WorkerPoolTest, EmptyTaskListIsFine) {
    const WorkerPool pool([](std::span<const std::uint8_t>, const ConversionJob&) {
        return std::vector<std::uint8_t>{};
    });
    EXPECT_TRUE(pool.run({}, ConversionJob{}).empty());
}
