#include <gtest/gtest.h>
#include "nearfetch/core/callback_context.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace nearfetch::core;
using namespace std::chrono_literals;

class CallbackContextTest : public ::testing::Test {
protected:
    std::shared_ptr<CallbackContext> context_ = std::make_shared<CallbackContext>();
};

TEST_F(CallbackContextTest, PostedTasksRunInOrder) {
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        context_->post([&order, i]() { order.push_back(i); });
    }

    EXPECT_TRUE(order.empty());
    context_->poll();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(CallbackContextTest, TasksRunInsideTheStrand) {
    bool inside = false;
    context_->post([&]() { inside = context_->running_in_this_thread(); });

    EXPECT_FALSE(context_->running_in_this_thread());
    context_->poll();
    EXPECT_TRUE(inside);
}

TEST_F(CallbackContextTest, ThrowingTaskDoesNotStopTheQueue) {
    bool ran = false;
    context_->post([]() { throw std::runtime_error("boom"); });
    context_->post([&]() { ran = true; });

    context_->poll();
    EXPECT_TRUE(ran);
}

TEST_F(CallbackContextTest, AlarmFiresAfterDelay) {
    bool fired = false;
    auto alarm = context_->schedule(20ms, [&]() { fired = true; });

    context_->poll();
    EXPECT_FALSE(fired);

    context_->run_for(100ms);
    EXPECT_TRUE(fired);
    EXPECT_TRUE(alarm->has_fired());
}

TEST_F(CallbackContextTest, CancelledAlarmNeverFires) {
    bool fired = false;
    auto alarm = context_->schedule(20ms, [&]() { fired = true; });
    alarm->cancel();

    context_->run_for(100ms);
    EXPECT_FALSE(fired);
    EXPECT_TRUE(alarm->is_cancelled());
    EXPECT_FALSE(alarm->has_fired());
}

TEST_F(CallbackContextTest, DedicatedThreadSerializesProducers) {
    ASSERT_TRUE(context_->start());
    EXPECT_FALSE(context_->start());

    std::atomic<int> active{0};
    std::atomic<bool> overlapped{false};
    std::atomic<int> completed{0};
    std::promise<void> done;

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                context_->post([&]() {
                    if (active.fetch_add(1) != 0) {
                        overlapped = true;
                    }
                    active.fetch_sub(1);
                    if (completed.fetch_add(1) + 1 == 200) {
                        done.set_value();
                    }
                });
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(overlapped);

    context_->stop();
    EXPECT_FALSE(context_->is_running());
}
