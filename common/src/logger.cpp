#include <atomic>
#include <chrono>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <thread>

#include <magic_enum.hpp>
#include <spdlog/sinks/base_sink.h>

#ifdef __linux__
#include <sys/syscall.h>
#include <unistd.h>
#endif

#include "qrelay/common/logger.h"

namespace qrelay {

static intmax_t current_thread_id() {
#ifdef __linux__
    return (intmax_t) syscall(SYS_gettid);
#else
    return (intmax_t) std::hash<std::thread::id>{}(std::this_thread::get_id());
#endif
}

static void default_callback(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    system_clock::time_point now = system_clock::now();
    std::time_t time = system_clock::to_time_t(now);

    tm tm = {};
    localtime_r(&time, &tm);

    char time_str[20];
    strftime(time_str, sizeof(time_str), "%d.%m.%Y %H:%M:%S", &tm);

    fprintf(stderr, "%s.%06d [%" PRIdMAX "] [%s] %.*s",
            time_str, (int) (duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000),
            current_thread_id(), magic_enum::enum_name(level).data(), (int) message.size(), message.data());
}

struct GlobalInfo {
    std::atomic<LogLevel> log_level = LOG_LEVEL_INFO;
    std::shared_ptr<Logger::Callback> callback = std::make_shared<Logger::Callback>(default_callback);
    std::mutex registry_mtx;

    GlobalInfo() {
        spdlog::set_pattern("[%n] %v");
    }
};

static GlobalInfo *get_globals() {
    static GlobalInfo info;
    return &info;
}

struct CallbackSink : spdlog::sinks::base_sink<std::mutex> {
    void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);

        std::shared_ptr<Logger::Callback> callback = std::atomic_load(&get_globals()->callback);
        (*callback)((LogLevel) msg.level, {formatted.data(), formatted.size()});
    }

    void flush_() override {
        // No op
    }
};

Logger::Logger(std::string_view name) {
    GlobalInfo *info = get_globals();
    std::string name_str{name};

    std::scoped_lock l(info->registry_mtx);
    m_logger = spdlog::get(name_str);
    if (m_logger == nullptr) {
        m_logger = spdlog::default_factory::create<CallbackSink>(name_str);
        m_logger->set_level((spdlog::level::level_enum) info->log_level.load());
    }
}

void Logger::set_log_level(LogLevel level) {
    get_globals()->log_level.store(level);
    spdlog::set_level((spdlog::level::level_enum) level);
}

LogLevel Logger::get_log_level() {
    return get_globals()->log_level.load();
}

void Logger::set_callback(Callback cb) {
    std::atomic_store(&get_globals()->callback,
            std::make_shared<Callback>(cb ? std::move(cb) : Callback{default_callback}));
}

} // namespace qrelay
