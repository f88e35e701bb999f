#include "hitl/Coordinator.hpp"
#include "hitl/rt/ThreadPool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace hitl;
using namespace std::chrono_literals;

// Many waiters across owners, a resolver thread approving whatever it sees,
// and short timeouts so some requests fall through to the default. Every
// waiter must finish and the registry must end empty.
TEST(StressTest, ManyWaitersResolversAndTimeouts) {
    Coordinator c;
    const int owners = 4;
    const int waiters = 64;

    rt::ThreadPool pool(waiters);
    std::atomic<int> finished{0};
    std::atomic<int> approved{0};
    std::atomic<bool> stop{false};

    for (int i = 0; i < waiters; ++i) {
        pool.post([&c, &finished, &approved, i, owners] {
            ToolRequest p;
            p.name = "tool" + std::to_string(i);
            // Odd waiters time out fast, even ones wait for the resolver.
            auto timeout = (i % 2) ? 30ms : 5000ms;
            if (c.requestDecision("owner" + std::to_string(i % owners), p, timeout, Decision::Reject)
                    == Decision::Approve) {
                approved++;
            }
            finished++;
        });
    }

    std::thread resolver([&c, &stop, owners] {
        while (!stop.load()) {
            for (int o = 0; o < owners; ++o) {
                for (const auto& s : c.listPending("owner" + std::to_string(o))) {
                    c.resolve(s.id, Decision::Approve);
                }
            }
            std::this_thread::sleep_for(1ms);
        }
    });

    pool.drain();
    stop = true;
    resolver.join();

    EXPECT_EQ(finished.load(), waiters);
    EXPECT_GE(approved.load(), waiters / 2);
    EXPECT_EQ(c.pendingCount(), 0u);
    for (int o = 0; o < owners; ++o) {
        EXPECT_FALSE(c.hasOwner("owner" + std::to_string(o)));
    }
}

TEST(StressTest, ThreadPoolHighConcurrency) {
    rt::ThreadPool pool(4);
    std::atomic<int> counter{0};
    const int tasks = 10000;

    for (int i = 0; i < tasks; ++i) {
        pool.post([&counter]() { counter++; });
    }

    pool.shutdown();
    EXPECT_EQ(counter.load(), tasks);
}
