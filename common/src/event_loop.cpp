#include <csignal>
#include <utility>

#include <event2/thread.h>

#include "qrelay/common/event_loop.h"
#include "qrelay/common/logger.h"
#include "qrelay/common/net_utils.h"

namespace qrelay {

static void libevent_log(int severity, const char *msg) {
    static Logger event_logger{"LIBEVENT"};
    switch (severity) {
    case EVENT_LOG_DEBUG:
        dbglog(event_logger, "{}", msg);
        break;
    case EVENT_LOG_MSG:
        infolog(event_logger, "{}", msg);
        break;
    case EVENT_LOG_WARN:
        warnlog(event_logger, "{}", msg);
        break;
    case EVENT_LOG_ERR:
        errlog(event_logger, "{}", msg);
        break;
    default:
        tracelog(event_logger, "({}) {}", severity, msg);
        break;
    }
}

// Done once per process, before any base is created
static bool init_libevent() {
    event_set_log_callback(libevent_log);
    return 0 == evthread_use_pthreads();
}

EventLoopPtr EventLoop::create(bool run_immediately) {
    EventLoopPtr loop{new EventLoop()};
    if (loop->m_base == nullptr) {
        return nullptr;
    }
    if (run_immediately) {
        loop->start();
    }
    return loop;
}

EventLoop::EventLoop() {
    static const bool threads_ready = init_libevent();
    if (!threads_ready) {
        return;
    }
    m_base.reset(event_base_new());
    if (m_base != nullptr && 0 != evthread_make_base_notifiable(m_base.get())) {
        m_base.reset();
    }
}

EventLoop::~EventLoop() {
    if (m_base == nullptr) {
        return;
    }
    stop();
    join();
    // Timers must go before the base
    std::scoped_lock l(m_scheduled.mtx);
    m_scheduled.val.clear();
}

void EventLoop::start() {
    join();
    m_thread = std::thread([this] {
        run();
    });
}

void EventLoop::submit(std::function<void()> task) {
    std::scoped_lock l(m_tasks.mtx);
    m_tasks.val.queue.emplace_back(std::move(task));
    if (!std::exchange(m_tasks.val.scheduled, true)) {
        event_base_once(m_base.get(), -1, EV_TIMEOUT, on_tasks, this, nullptr);
    }
}

void EventLoop::on_tasks(evutil_socket_t, short, void *arg) {
    ((EventLoop *) arg)->drain_tasks();
}

void EventLoop::drain_tasks() {
    std::deque<std::function<void()>> batch;
    {
        std::scoped_lock l(m_tasks.mtx);
        batch.swap(m_tasks.val.queue);
        m_tasks.val.scheduled = false;
    }
    // Tasks submitted from here on get their own event
    for (auto &task : batch) {
        task();
    }
}

EventLoop::TaskId EventLoop::schedule(Micros delay, std::function<void()> task) {
    TaskId id = m_next_task_id.fetch_add(1, std::memory_order_relaxed);
    auto scheduled = std::make_unique<ScheduledTask>(ScheduledTask{this, id, nullptr, std::move(task)});
    scheduled->timer.reset(evtimer_new(m_base.get(), on_timer, scheduled.get()));

    std::scoped_lock l(m_scheduled.mtx);
    timeval tv = utils::duration_to_timeval(delay);
    if (scheduled->timer == nullptr || 0 != evtimer_add(scheduled->timer.get(), &tv)) {
        static Logger log{"EventLoop"};
        errlog(log, "Failed to schedule task {}", id);
        return id;
    }
    m_scheduled.val.emplace(id, std::move(scheduled));
    return id;
}

void EventLoop::on_timer(evutil_socket_t, short, void *arg) {
    auto *timer_task = (ScheduledTask *) arg;
    EventLoop *self = timer_task->loop;

    std::unique_ptr<ScheduledTask> task;
    {
        std::scoped_lock l(self->m_scheduled.mtx);
        if (auto node = self->m_scheduled.val.extract(timer_task->id); !node.empty()) {
            task = std::move(node.mapped());
        }
    }
    if (task != nullptr && task->func) {
        task->func();
    }
}

void EventLoop::cancel(TaskId id) {
    std::unique_ptr<ScheduledTask> task;
    {
        std::scoped_lock l(m_scheduled.mtx);
        if (auto node = m_scheduled.val.extract(id); !node.empty()) {
            task = std::move(node.mapped());
        }
    }
    // `task` dies after the lock is released: `event_free` waits for a callback running on the loop thread
}

void EventLoop::stop() {
    event_base_loopexit(m_base.get(), nullptr);
}

void EventLoop::join() {
    if (m_thread.joinable() && !is_loop_thread()) {
        m_thread.join();
    }
}

bool EventLoop::is_loop_thread() const {
    return m_thread.get_id() == std::this_thread::get_id();
}

event_base *EventLoop::c_base() {
    return m_base.get();
}

void EventLoop::run() {
    sigset_t blocked;
    sigset_t previous;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &blocked, &previous);

    event_base_loop(m_base.get(), EVLOOP_NO_EXIT_ON_EMPTY);

    pthread_sigmask(SIG_SETMASK, &previous, nullptr);

    drain_tasks();
}

} // namespace qrelay
