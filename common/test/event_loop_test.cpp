#include <atomic>
#include <future>

#include <gtest/gtest.h>

#include "qrelay/common/event_loop.h"
#include "qrelay/common/logger.h"

namespace qrelay::test {

using namespace std::chrono_literals;

TEST(EventLoop, Submit) {
    static Logger log{"Submit"};
    auto loop = EventLoop::create();
    ASSERT_NE(nullptr, loop);

    std::promise<int> result;
    loop->submit([&result, &loop] {
        infolog(log, "Hello!");
        ASSERT_TRUE(loop->is_loop_thread());
        result.set_value(42);
    });
    ASSERT_EQ(42, result.get_future().get());

    loop->stop();
    loop->join();
}

TEST(EventLoop, ScheduleAndCancel) {
    auto loop = EventLoop::create();
    std::atomic_int fired = 0;
    std::promise<void> done;

    EventLoop::TaskId cancelled = loop->schedule(Micros{50ms}, [&fired] {
        fired += 100;
    });
    loop->cancel(cancelled);
    loop->schedule(Micros{100ms}, [&fired, &done] {
        fired += 1;
        done.set_value();
    });

    ASSERT_EQ(std::future_status::ready, done.get_future().wait_for(2s));
    ASSERT_EQ(1, fired.load());
}

TEST(EventLoop, RestartAfterStop) {
    auto loop = EventLoop::create(false);
    std::atomic_int counter = 0;
    for (int i = 0; i < 3; ++i) {
        loop->submit([&counter, &loop] {
            ++counter;
            loop->stop();
        });
        loop->start();
        loop->join();
    }
    ASSERT_EQ(3, counter.load());
}

} // namespace qrelay::test
