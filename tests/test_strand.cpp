#include <gtest/gtest.h>

#include "fakes.hpp"
#include "utils/strand.hpp"
#include "utils/thread_pool.hpp"

namespace jukebox {
namespace {

using testing::wait_until;

TEST(StrandTest, RunsTasksInPostOrder) {
    ThreadPool pool(4, "test");
    auto strand = std::make_shared<Strand>(pool);

    std::mutex mutex;
    std::vector<int> seen;
    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(strand->post([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(i);
        }));
    }

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size() == 200;
    }));
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(seen[i], i);
    }
}

TEST(StrandTest, TasksNeverOverlap) {
    ThreadPool pool(4, "test");
    auto strand = std::make_shared<Strand>(pool);

    std::atomic<int> inside{0};
    std::atomic<int> overlaps{0};
    std::atomic<int> done{0};
    for (int i = 0; i < 100; ++i) {
        strand->post([&]() {
            if (inside.fetch_add(1) != 0) {
                ++overlaps;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            --inside;
            ++done;
        });
    }

    ASSERT_TRUE(wait_until([&] { return done == 100; }));
    EXPECT_EQ(overlaps.load(), 0);
}

TEST(StrandTest, DispatchReturnsResult) {
    ThreadPool pool(2, "test");
    auto strand = std::make_shared<Strand>(pool);

    EXPECT_EQ(strand->dispatch([]() { return 7 * 6; }), 42);
    EXPECT_FALSE(strand->running_in_this_thread());
}

// Nested dispatch would deadlock if it queued behind its caller
TEST(StrandTest, NestedDispatchRunsInline) {
    ThreadPool pool(1, "test");
    auto strand = std::make_shared<Strand>(pool);

    int result = strand->dispatch([&]() {
        EXPECT_TRUE(strand->running_in_this_thread());
        return strand->dispatch([]() { return 5; }) + 1;
    });
    EXPECT_EQ(result, 6);
}

TEST(StrandTest, ExceptionsPropagateThroughDispatch) {
    ThreadPool pool(2, "test");
    auto strand = std::make_shared<Strand>(pool);

    EXPECT_THROW(strand->dispatch([]() -> int { throw std::runtime_error("bad"); }), std::runtime_error);
    EXPECT_EQ(strand->dispatch([]() { return 1; }), 1);
}

TEST(StrandTest, ThrowingPostedTaskDoesNotStall) {
    ThreadPool pool(2, "test");
    auto strand = std::make_shared<Strand>(pool);

    strand->post([]() { throw std::runtime_error("bad"); });
    EXPECT_EQ(strand->dispatch([]() { return 3; }), 3);
}

TEST(StrandTest, PostFailsAfterShutdown) {
    ThreadPool pool(2, "test");
    auto strand = std::make_shared<Strand>(pool);
    pool.shutdown();

    EXPECT_FALSE(pool.running());
    EXPECT_FALSE(strand->post([]() {}));
    EXPECT_THROW(strand->dispatch([]() { return 1; }), std::runtime_error);
}

TEST(ThreadPoolTest, TryEnqueueReportsShutdown) {
    ThreadPool pool(2, "test");
    EXPECT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool.name(), "test");

    std::atomic<bool> ran{false};
    EXPECT_TRUE(pool.try_enqueue([&]() { ran = true; }));
    ASSERT_TRUE(wait_until([&] { return ran.load(); }));

    pool.shutdown();
    pool.shutdown();
    EXPECT_FALSE(pool.try_enqueue([]() {}));
}

TEST(ThreadPoolTest, ShutdownRunsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        ThreadPool pool(1, "test");
        for (int i = 0; i < 20; ++i) {
            pool.enqueue([&]() { ++ran; });
        }
        pool.shutdown();
        EXPECT_THROW(pool.enqueue([]() {}), std::runtime_error);
    }
    EXPECT_EQ(ran.load(), 20);
}

} // namespace
} // namespace jukebox
