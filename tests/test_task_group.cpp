#include "util/channel.hpp"
#include "util/task_group.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>

namespace imgbuild {
namespace {

using namespace std::chrono_literals;

TEST(ChannelTest, DeliversInOrderThenEnds) {
    Channel<int> ch(2);
    std::jthread producer([&] {
        for (int i = 0; i < 100; ++i)
            ch.Send(i);
        ch.Close();
    });

    int expected = 0;
    int v = 0;
    while (ch.Receive(v)) {
        EXPECT_EQ(v, expected);
        ++expected;
    }
    EXPECT_EQ(expected, 100);
}

TEST(ChannelTest, SendAfterCloseFails) {
    Channel<int> ch(4);
    ch.Close();
    EXPECT_FALSE(ch.Send(1));
    EXPECT_TRUE(ch.Closed());
}

TEST(ChannelTest, CloseDrainsPendingItems) {
    Channel<std::string> ch(4);
    ASSERT_TRUE(ch.Send("a"));
    ASSERT_TRUE(ch.Send("b"));
    ch.Close();

    std::string v;
    ASSERT_TRUE(ch.Receive(v));
    EXPECT_EQ(v, "a");
    ASSERT_TRUE(ch.Receive(v));
    EXPECT_EQ(v, "b");
    EXPECT_FALSE(ch.Receive(v));
}

TEST(ChannelTest, StopUnblocksReceiveAndSend) {
    Channel<int> ch(1);
    std::stop_source ss;

    std::jthread stopper([&] {
        std::this_thread::sleep_for(50ms);
        ss.request_stop();
    });

    int v = 0;
    EXPECT_FALSE(ch.Receive(v, ss.get_token()));

    ASSERT_TRUE(ch.Send(1));
    EXPECT_FALSE(ch.Send(2, ss.get_token()));
}

TEST(TaskGroupTest, AllSucceed) {
    TaskGroup group;
    std::atomic_int ran{0};
    for (int i = 0; i < 3; ++i) {
        group.Go([&](std::stop_token) {
            ++ran;
            return Result::Ok();
        });
    }
    EXPECT_TRUE(group.Wait().is_ok());
    EXPECT_EQ(ran.load(), 3);
}

TEST(TaskGroupTest, FirstErrorWinsAndStopsSiblings) {
    TaskGroup group;
    std::atomic_bool sibling_saw_stop{false};

    group.Go([&](std::stop_token st) {
        while (!st.stop_requested())
            std::this_thread::sleep_for(1ms);
        sibling_saw_stop = true;
        return Result::Cancelled("stopped");
    });
    group.Go([](std::stop_token) {
        std::this_thread::sleep_for(20ms);
        return Result::Fail(EIO, "disk on fire");
    });

    const auto start = std::chrono::steady_clock::now();
    Result r = group.Wait();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.msg, "disk on fire");
    EXPECT_EQ(r.err, EIO);
    EXPECT_TRUE(sibling_saw_stop.load());
}

TEST(TaskGroupTest, ParentStopCancelsGroup) {
    std::stop_source parent;
    TaskGroup group(parent.get_token());

    group.Go([](std::stop_token st) {
        while (!st.stop_requested())
            std::this_thread::sleep_for(1ms);
        return Result::Cancelled("cancelled");
    });

    parent.request_stop();
    Result r = group.Wait();
    EXPECT_TRUE(r.is_cancelled());
}

TEST(TaskGroupTest, ExceptionBecomesError) {
    TaskGroup group;
    group.Go([](std::stop_token) -> Result { throw std::runtime_error("boom"); });
    Result r = group.Wait();
    ASSERT_FALSE(r.is_ok());
    EXPECT_NE(r.msg.find("boom"), std::string::npos);
}

} // namespace
} // namespace imgbuild
