#include <gtest/gtest.h>
#include "upload/CompletionBarrier.hpp"

#include <atomic>
#include <thread>

using namespace cw::upload;
using namespace std::chrono_literals;

TEST(CompletionBarrierTest, OpenWithNothingExpected) {
    CompletionBarrier barrier;
    EXPECT_TRUE(barrier.isOpen());
    EXPECT_TRUE(barrier.wait(0ms));
}

TEST(CompletionBarrierTest, OpensAfterEverySignal) {
    CompletionBarrier barrier;
    barrier.expect(1);
    barrier.expect(2);
    EXPECT_FALSE(barrier.isOpen());

    barrier.signal(1);
    EXPECT_FALSE(barrier.isOpen());
    EXPECT_EQ(barrier.outstanding(), (std::set<unsigned int>{2}));

    barrier.signal(2);
    EXPECT_TRUE(barrier.isOpen());
    EXPECT_TRUE(barrier.outstanding().empty());
}

TEST(CompletionBarrierTest, ListenerFiresOnceWhenOpened) {
    CompletionBarrier barrier;
    barrier.expect(1);

    int fired = 0;
    barrier.subscribe([&] { ++fired; });
    EXPECT_EQ(fired, 0);

    barrier.signal(1);
    barrier.signal(1);
    EXPECT_EQ(fired, 1);

    barrier.subscribe([&] { ++fired; });
    EXPECT_EQ(fired, 2);
}

TEST(CompletionBarrierTest, WaitTimesOut) {
    CompletionBarrier barrier;
    barrier.expect(3);
    EXPECT_FALSE(barrier.wait(10ms));
}

TEST(CompletionBarrierTest, WaitReleasedByOtherThread) {
    CompletionBarrier barrier;
    barrier.expect(1);

    std::thread t([&] {
        std::this_thread::sleep_for(20ms);
        barrier.signal(1);
    });
    EXPECT_TRUE(barrier.wait(5s));
    t.join();
}

TEST(CompletionBarrierTest, AbortWakesWaiters) {
    CompletionBarrier barrier;
    barrier.expect(1);

    std::atomic<bool> result{true};
    std::thread waiter([&] { result = barrier.wait(); });
    std::this_thread::sleep_for(20ms);
    barrier.abort();
    waiter.join();

    EXPECT_FALSE(result);
    EXPECT_TRUE(barrier.isAborted());
    EXPECT_FALSE(barrier.isOpen());
}
