#include <gtest/gtest.h>
#include "concurrency/AdmissionGate.hpp"
#include "concurrency/Channel.hpp"
#include "concurrency/ThreadPool.hpp"

#include <thread>
#include <vector>

using namespace ms::concurrency;
using namespace std::chrono_literals;

namespace {

struct Sleeper final : Task {
    AdmissionGate::Slot slot;
    std::atomic<unsigned int>& active;
    std::atomic<unsigned int>& maxActive;

    Sleeper(AdmissionGate::Slot s, std::atomic<unsigned int>& a, std::atomic<unsigned int>& m)
        : slot(std::move(s)), active(a), maxActive(m) {}

    void operator()() override {
        const auto now = ++active;
        auto prev = maxActive.load();
        while (now > prev && !maxActive.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(5ms);
        --active;
        slot.reset();
    }
};

struct Counter final : Task {
    std::atomic<unsigned int>& runs;
    explicit Counter(std::atomic<unsigned int>& r) : runs(r) {}
    void operator()() override { ++runs; }
};

}

TEST(ChannelTest, DeliversInOrderAndDrains) {
    Channel<int> ch;
    for (int i = 0; i < 5; ++i) ASSERT_TRUE(ch.push(i));
    ch.close();
    EXPECT_FALSE(ch.push(99));

    std::vector<int> seen;
    while (auto v = ch.pop()) seen.push_back(*v);
    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_TRUE(ch.drained());
}

TEST(ChannelTest, BoundedPushGivesUpOnInterrupt) {
    Channel<int> ch(1);
    std::atomic<bool> interrupt{false};
    ASSERT_TRUE(ch.push(1, &interrupt));

    std::thread t([&] {
        std::this_thread::sleep_for(20ms);
        interrupt = true;
    });
    EXPECT_FALSE(ch.push(2, &interrupt));
    t.join();
    EXPECT_EQ(ch.size(), 1u);
}

TEST(ChannelTest, PopForTimesOut) {
    Channel<int> ch;
    EXPECT_FALSE(ch.popFor(10ms).has_value());
    EXPECT_FALSE(ch.drained());
}

TEST(AdmissionGateTest, NeverAdmitsMoreThanCapacity) {
    constexpr unsigned int capacity = 3;
    AdmissionGate gate(capacity);
    std::atomic<unsigned int> active{0}, maxActive{0};

    {
        ThreadPool pool(8);
        for (int i = 0; i < 40; ++i) {
            auto slot = gate.acquire();
            ASSERT_TRUE(slot.has_value());
            pool.submit(std::make_shared<Sleeper>(std::move(*slot), active, maxActive));
        }
        gate.waitIdle();
    }

    EXPECT_LE(gate.peak(), capacity);
    EXPECT_LE(maxActive.load(), capacity);
    EXPECT_GE(gate.peak(), 1u);
}

TEST(AdmissionGateTest, AcquireReturnsNulloptWhenInterrupted) {
    AdmissionGate gate(1);
    auto held = gate.acquire();
    ASSERT_TRUE(held.has_value());

    std::atomic<bool> interrupt{true};
    EXPECT_FALSE(gate.acquire(&interrupt).has_value());

    held->reset();
    EXPECT_TRUE(gate.acquire().has_value());
}

TEST(AdmissionGateTest, SlotReleasesOnDestruction) {
    AdmissionGate gate(1);
    { auto slot = gate.acquire(); }
    auto again = gate.acquire();
    EXPECT_TRUE(again && again->held());
}

TEST(ThreadPoolTest, StopRunsQueuedTasksThenJoins) {
    std::atomic<unsigned int> runs{0};
    ThreadPool pool(3);
    for (int i = 0; i < 50; ++i) pool.submit(std::make_shared<Counter>(runs));
    pool.stop();
    EXPECT_EQ(runs.load(), 50u);
    EXPECT_EQ(pool.workerCount(), 0u);
    EXPECT_THROW(pool.submit(std::make_shared<Counter>(runs)), std::runtime_error);
}

TEST(ThreadPoolTest, RepeatedStartStopNeverHangs) {
    // idle workers race stop() into their wait; every cycle must join
    for (int i = 0; i < 500; ++i) {
        ThreadPool pool(2);
        pool.stop();
    }
    SUCCEED();
}
