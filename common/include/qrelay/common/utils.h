#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "qrelay/common/defs.h"

/**
 * Macros for fmt::format with compile-time checked FMT_STRING
 */
#define QRELAY_FMT(FORMAT, ...) fmt::format(FMT_STRING(FORMAT), ##__VA_ARGS__)

namespace qrelay::utils {

enum TransportProtocol {
    TP_UDP,
    TP_TCP,
};

/**
 * Transform string in lowercase
 */
static inline std::string to_lower(std::string_view str) {
    std::string lwr;
    lwr.reserve(str.length());
    std::transform(str.cbegin(), str.cend(), std::back_inserter(lwr), (int (*)(int)) std::tolower);
    return lwr;
}

/**
 * Trim whitespaces-only prefix and suffix
 */
static inline std::string_view trim(std::string_view str) {
    auto pos1 = std::find_if(str.begin(), str.end(), std::not_fn((int (*)(int)) std::isspace));
    str.remove_prefix(std::distance(str.begin(), pos1));
    auto pos2 = std::find_if(str.rbegin(), str.rend(), std::not_fn((int (*)(int)) std::isspace));
    str.remove_suffix(std::distance(str.rbegin(), pos2));
    return str;
}

/**
 * Splits string by delimiter. Empty and whitespace-only parts are skipped.
 */
std::vector<std::string_view> split_by(std::string_view str, char delim);

/**
 * Parse the whole string as a decimal integer
 * @return none if the string is not a number or does not fit in T
 */
template <typename T>
std::optional<T> to_integer(std::string_view str) {
    static_assert(std::is_integral_v<T>, "Integral type expected");
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * Measures time elapsed since construction or the last `reset()`
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : m_start(Clock::now()) {}

    template <typename T>
    [[nodiscard]] T elapsed() const {
        return std::chrono::duration_cast<T>(Clock::now() - m_start);
    }

    void reset() {
        m_start = Clock::now();
    }

private:
    Clock::time_point m_start;
};

/**
 * Calls the supplied function in destructor.
 * Useful to ensure cleanup if the control flow can exit the scope in multiple different ways.
 */
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> &&f) : m_f{std::move(f)} {}
    ~ScopeExit() {
        if (m_f) {
            m_f();
        }
    }

    ScopeExit(const ScopeExit &) = delete;
    ScopeExit &operator=(const ScopeExit &) = delete;
    ScopeExit(ScopeExit &&) = delete;
    ScopeExit &operator=(ScopeExit &&) = delete;

    /**
     * Disarm the guard so the function is not called
     */
    void release() {
        m_f = nullptr;
    }

private:
    std::function<void()> m_f;
};

} // namespace qrelay::utils
