#include "hitl/WaitHandle.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace hitl;
using namespace std::chrono_literals;

TEST(WaitHandleTest, ResolveBeforeAwaitIsDelivered) {
    auto h = WaitHandle::create();
    EXPECT_TRUE(h->resolve(Decision::Approve));
    auto r = h->await(1s);
    EXPECT_EQ(r.status, WaitStatus::Decided);
    EXPECT_EQ(r.decision, Decision::Approve);
}

TEST(WaitHandleTest, ResolveFromOtherThreadWakesWaiter) {
    auto h = WaitHandle::create();
    std::thread t([h] {
        std::this_thread::sleep_for(20ms);
        h->resolve(Decision::Reject);
    });
    auto start = std::chrono::steady_clock::now();
    auto r = h->await(5s);
    auto took = std::chrono::steady_clock::now() - start;
    t.join();
    EXPECT_EQ(r.status, WaitStatus::Decided);
    EXPECT_EQ(r.decision, Decision::Reject);
    EXPECT_LT(took, 2s);
}

TEST(WaitHandleTest, SecondResolveLosesAndDoesNotOverwrite) {
    auto h = WaitHandle::create();
    EXPECT_TRUE(h->resolve(Decision::Approve));
    EXPECT_FALSE(h->resolve(Decision::Reject));
    EXPECT_FALSE(h->cancel());
    EXPECT_EQ(h->state().decision, Decision::Approve);
}

TEST(WaitHandleTest, TimeoutSettlesHandle) {
    auto h = WaitHandle::create();
    auto start = std::chrono::steady_clock::now();
    auto r = h->await(50ms);
    auto took = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(r.status, WaitStatus::TimedOut);
    EXPECT_GE(took, 45ms);
    EXPECT_LT(took, 500ms);
    // Too late.
    EXPECT_FALSE(h->resolve(Decision::Approve));
    EXPECT_FALSE(h->isPending());
}

TEST(WaitHandleTest, CancelTokenUnblocksPromptly) {
    auto h = WaitHandle::create();
    CancellationSource src;
    std::thread t([&src] {
        std::this_thread::sleep_for(20ms);
        src.requestCancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = h->await(10s, src.token());
    auto took = std::chrono::steady_clock::now() - start;
    t.join();
    EXPECT_EQ(r.status, WaitStatus::Cancelled);
    EXPECT_LT(took, 2s);
    EXPECT_FALSE(h->resolve(Decision::Approve));
}

TEST(WaitHandleTest, AlreadyCancelledTokenReturnsImmediately) {
    auto h = WaitHandle::create();
    CancellationSource src;
    src.requestCancel();
    auto r = h->await(10s, src.token());
    EXPECT_EQ(r.status, WaitStatus::Cancelled);
}

TEST(WaitHandleTest, ConcurrentResolversExactlyOneWins) {
    for (int round = 0; round < 50; ++round) {
        auto h = WaitHandle::create();
        std::atomic<int> winners{0};
        std::vector<std::thread> ths;
        for (int i = 0; i < 8; ++i) {
            ths.emplace_back([h, &winners, i] {
                if (h->resolve(i % 2 ? Decision::Approve : Decision::Reject)) winners++;
            });
        }
        auto r = h->await(5s);
        for (auto& t : ths) t.join();
        EXPECT_EQ(winners.load(), 1);
        EXPECT_EQ(r.status, WaitStatus::Decided);
        EXPECT_EQ(h->state().decision, r.decision);
    }
}

TEST(WaitHandleTest, HugeTimeoutStillBlocksUntilResolved) {
    auto h = WaitHandle::create();
    std::atomic<bool> returned{false};
    WaitResult r;
    std::thread waiter([&] {
        r = h->await(std::chrono::milliseconds(10000000000000LL));
        returned = true;
    });
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(returned.load());
    EXPECT_TRUE(h->isPending());
    EXPECT_TRUE(h->resolve(Decision::Reject));
    waiter.join();
    EXPECT_EQ(r.status, WaitStatus::Decided);
    EXPECT_EQ(r.decision, Decision::Reject);
}

TEST(WaitHandleTest, MaxTimeoutStillBlocksUntilResolved) {
    auto h = WaitHandle::create();
    std::thread t([h] {
        std::this_thread::sleep_for(30ms);
        h->resolve(Decision::Approve);
    });
    auto r = h->await(std::chrono::milliseconds::max());
    t.join();
    EXPECT_EQ(r.status, WaitStatus::Decided);
    EXPECT_EQ(r.decision, Decision::Approve);
}

TEST(WaitHandleTest, StatusNames) {
    EXPECT_STREQ(toString(WaitStatus::Pending), "pending");
    EXPECT_STREQ(toString(WaitStatus::Decided), "decided");
    EXPECT_STREQ(toString(WaitStatus::TimedOut), "timed_out");
    EXPECT_STREQ(toString(WaitStatus::Cancelled), "cancelled");
}
