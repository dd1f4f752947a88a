#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <thread>

#include <event2/event.h>

#include "qrelay/common/defs.h"

namespace qrelay {

class EventLoop;
using EventLoopPtr = std::unique_ptr<EventLoop>;

/**
 * Libevent base running on a dedicated thread, with a thread-safe task queue and timers
 */
class EventLoop {
public:
    /** Identifier of a scheduled task. Zero is never issued. */
    using TaskId = uint64_t;

    /**
     * @param run_immediately if true, the loop thread is started right away
     * @return new event loop, or null if libevent failed to create a base
     */
    static EventLoopPtr create(bool run_immediately = true);

    ~EventLoop();

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;
    EventLoop(EventLoop &&) = delete;
    EventLoop &operator=(EventLoop &&) = delete;

    /**
     * Start the loop thread. A previous run is joined first.
     */
    void start();

    /**
     * Run `task` on the loop thread. Tasks run in submission order.
     * Tasks still queued when the loop exits are run before the thread finishes.
     */
    void submit(std::function<void()> task);

    /**
     * Run `task` on the loop thread once `delay` has passed
     */
    TaskId schedule(Micros delay, std::function<void()> task);

    /**
     * Forget a scheduled task. A task that is already running is not interrupted.
     */
    void cancel(TaskId id);

    /**
     * Make the loop exit after the current iteration
     */
    void stop();

    /**
     * Wait for the loop thread. No-op on the loop thread itself.
     */
    void join();

    [[nodiscard]] bool is_loop_thread() const;

    event_base *c_base();

private:
    struct ScheduledTask {
        EventLoop *loop;
        TaskId id;
        UniquePtr<event, &event_free> timer;
        std::function<void()> func;
    };

    struct Tasks {
        /** An event is pending which will drain the queue */
        bool scheduled = false;
        std::deque<std::function<void()>> queue;
    };

    UniquePtr<event_base, &event_base_free> m_base;
    std::thread m_thread;
    WithMtx<Tasks> m_tasks;
    WithMtx<HashMap<TaskId, std::unique_ptr<ScheduledTask>>> m_scheduled;
    std::atomic<TaskId> m_next_task_id{1};

    EventLoop();

    void run();
    void drain_tasks();

    static void on_tasks(evutil_socket_t, short, void *arg);
    static void on_timer(evutil_socket_t, short, void *arg);
};

} // namespace qrelay
