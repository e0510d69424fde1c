#include <gtest/gtest.h>
#include <sweep/util/tree_lock.hpp>
#include <sweep/util/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace sweep;

// ============================================================================
// WorkerPool
// ============================================================================

TEST(WorkerPoolTest, RunsEveryTask) {
    WorkerPool pool(4, "test");
    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i) {
        pool.submit([&sum, i] { sum += i; });
    }
    pool.wait_idle();
    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(pool.failure_count(), 0);
}

TEST(WorkerPoolTest, ZeroWorkersStillRuns) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.worker_count(), 1);

    std::atomic<bool> ran{false};
    pool.submit([&ran] { ran = true; });
    pool.wait_idle();
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, ThrowingTaskIsCountedNotFatal) {
    WorkerPool pool(2, "test");
    std::atomic<int> completed{0};

    pool.submit([] { throw std::runtime_error("boom"); });
    for (int i = 0; i < 10; ++i) {
        pool.submit([&completed] { ++completed; });
    }
    pool.wait_idle();

    EXPECT_EQ(completed.load(), 10);
    EXPECT_EQ(pool.failure_count(), 1);
    auto messages = pool.failure_messages();
    ASSERT_EQ(messages.size(), 1);
    EXPECT_EQ(messages[0], "boom");
}

TEST(WorkerPoolTest, DestructorDrainsQueue) {
    std::atomic<int> completed{0};
    {
        WorkerPool pool(1, "test");
        for (int i = 0; i < 20; ++i) {
            pool.submit([&completed] { ++completed; });
        }
    }
    EXPECT_EQ(completed.load(), 20);
}

TEST(WorkerPoolTest, WaitIdleCanBeReused) {
    WorkerPool pool(3, "test");
    std::atomic<int> count{0};
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 10; ++i) {
            pool.submit([&count] { ++count; });
        }
        pool.wait_idle();
        EXPECT_EQ(count.load(), (round + 1) * 10);
    }
}

TEST(WorkerPoolTest, DefaultWorkerCountIsBounded) {
    EXPECT_GE(default_worker_count(), 1);
    EXPECT_LE(default_worker_count(), MAX_WORKERS);
}

// ============================================================================
// CancellationToken
// ============================================================================

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.cancelled());

    token.cancel();
    EXPECT_TRUE(copy.cancelled());
}

// ============================================================================
// TreeLockRegistry
// ============================================================================

TEST(TreeLockTest, DisjointTreesCoexist) {
    TreeLockRegistry registry;
    TreeLock a = registry.try_acquire({"/data/a"});
    TreeLock b = registry.try_acquire({"/data/b"});
    EXPECT_TRUE(a.held());
    EXPECT_TRUE(b.held());
    EXPECT_EQ(registry.held_count(), 2);
}

TEST(TreeLockTest, NestedTreesConflict) {
    TreeLockRegistry registry;
    TreeLock outer = registry.try_acquire({"/data"});
    ASSERT_TRUE(outer.held());

    EXPECT_FALSE(registry.try_acquire({"/data/a/b"}).held());
    EXPECT_FALSE(registry.try_acquire({"/"}).held());
    EXPECT_TRUE(registry.try_acquire({"/database"}).held());
}

TEST(TreeLockTest, ReleaseOnDestruction) {
    TreeLockRegistry registry;
    {
        TreeLock lock = registry.try_acquire({"/data"});
        ASSERT_TRUE(lock.held());
    }
    EXPECT_EQ(registry.held_count(), 0);
    EXPECT_TRUE(registry.try_acquire({"/data"}).held());
}

TEST(TreeLockTest, MoveTransfersOwnership) {
    TreeLockRegistry registry;
    TreeLock first = registry.try_acquire({"/data"});
    TreeLock second = std::move(first);
    EXPECT_FALSE(first.held());
    EXPECT_TRUE(second.held());
    EXPECT_EQ(registry.held_count(), 1);

    second.release();
    EXPECT_EQ(registry.held_count(), 0);
}

TEST(TreeLockTest, AcquireWaitsForConflictingHolder) {
    TreeLockRegistry registry;
    TreeLock held = registry.acquire({"/data"});
    std::atomic<bool> acquired{false};

    std::thread waiter([&] {
        TreeLock lock = registry.acquire({"/data/sub"});
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());

    held.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(registry.held_count(), 0);
}
