#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace qrelay {

enum LogLevel {
    LOG_LEVEL_TRACE = SPDLOG_LEVEL_TRACE,
    LOG_LEVEL_DEBUG = SPDLOG_LEVEL_DEBUG,
    LOG_LEVEL_INFO = SPDLOG_LEVEL_INFO,
    LOG_LEVEL_WARN = SPDLOG_LEVEL_WARN,
    LOG_LEVEL_ERROR = SPDLOG_LEVEL_ERROR,
};

/**
 * Named logger. All the instances share the program-wide level and output callback.
 */
class Logger {
public:
    using Callback = std::function<void(LogLevel level, std::string_view message)>;

    explicit Logger(std::string_view name);

    /**
     * Set a program-wide logging level
     * @param level desired logging level
     */
    static void set_log_level(LogLevel level);

    /**
     * @return the program-wide logging level
     */
    static LogLevel get_log_level();

    /**
     * Set the function that outputs a log message.
     * @param cb the callback, or an empty function to restore the default stderr output
     */
    static void set_callback(Callback cb);

    [[nodiscard]] bool is_enabled(LogLevel level) const {
        return m_logger->should_log((spdlog::level::level_enum) level);
    }

    spdlog::logger *operator->() const {
        return m_logger.get();
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace qrelay

#define errlog(l_, fmt_, ...) do { (l_)->error(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define infolog(l_, fmt_, ...) do { (l_)->info(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define warnlog(l_, fmt_, ...) do { (l_)->warn(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define dbglog(l_, fmt_, ...) do { if ((l_)->should_log(spdlog::level::debug)) (l_)->debug(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
#define tracelog(l_, fmt_, ...) do { if ((l_)->should_log(spdlog::level::trace)) (l_)->trace(FMT_STRING(fmt_), ##__VA_ARGS__); } while (0)
