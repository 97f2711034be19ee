#include <gtest/gtest.h>
#include "devmux/core/dispatcher.h"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace devmux::core;

TEST(ImmediateDispatcherTest, RunsInline) {
    ImmediateDispatcher dispatcher;
    bool ran = false;
    const auto caller = std::this_thread::get_id();
    std::thread::id runner;

    dispatcher.post([&]() {
        ran = true;
        runner = std::this_thread::get_id();
    });

    EXPECT_TRUE(ran);
    EXPECT_EQ(runner, caller);
}

TEST(ImmediateDispatcherTest, ThrowingTaskDoesNotEscape) {
    ImmediateDispatcher dispatcher;
    EXPECT_NO_THROW(dispatcher.post([]() { throw std::runtime_error("observer bug"); }));
}

TEST(ImmediateDispatcherTest, NonStandardThrowDoesNotEscape) {
    ImmediateDispatcher dispatcher;
    EXPECT_NO_THROW(dispatcher.post([]() { throw 42; }));
}

class SerialDispatcherTest : public ::testing::Test {
protected:
    SerialDispatcher dispatcher;
};

TEST_F(SerialDispatcherTest, RunsTasksInOrderOnWorker) {
    std::vector<int> order;
    std::atomic<bool> onWorker{true};

    for (int i = 0; i < 100; ++i) {
        dispatcher.post([&, i]() {
            if (!dispatcher.isWorkerThread()) {
                onWorker = false;
            }
            order.push_back(i);
        });
    }
    dispatcher.flush();

    ASSERT_EQ(order.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(order[i], i);
    }
    EXPECT_TRUE(onWorker);
    EXPECT_FALSE(dispatcher.isWorkerThread());
}

TEST_F(SerialDispatcherTest, SerializesConcurrentPosts) {
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
    std::atomic<int> completed{0};

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                dispatcher.post([&]() {
                    int now = ++running;
                    int seen = maxRunning.load();
                    while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {
                    }
                    --running;
                    ++completed;
                });
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    dispatcher.flush();

    EXPECT_EQ(completed.load(), 200);
    EXPECT_EQ(maxRunning.load(), 1);
}

TEST_F(SerialDispatcherTest, TaskMayPostFollowUp) {
    std::atomic<int> count{0};

    dispatcher.post([&]() {
        ++count;
        dispatcher.post([&]() { ++count; });
    });
    dispatcher.flush();

    EXPECT_EQ(count.load(), 2);
}

TEST_F(SerialDispatcherTest, FlushFromTaskReturns) {
    std::atomic<bool> flushed{false};

    dispatcher.post([&]() {
        dispatcher.flush();
        flushed = true;
    });
    dispatcher.flush();

    EXPECT_TRUE(flushed.load());
}

TEST_F(SerialDispatcherTest, WorkerSurvivesThrowingTask) {
    std::atomic<int> count{0};

    dispatcher.post([]() { throw std::string("not an exception type"); });
    dispatcher.post([&]() { ++count; });
    dispatcher.flush();

    EXPECT_EQ(count.load(), 1);
}

TEST(SerialDispatcherShutdownTest, DrainsQueueOnDestruction) {
    std::atomic<int> count{0};
    {
        SerialDispatcher dispatcher;
        for (int i = 0; i < 20; ++i) {
            dispatcher.post([&count]() { ++count; });
        }
    }
    EXPECT_EQ(count.load(), 20);
}
