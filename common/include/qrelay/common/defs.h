#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace qrelay {

// Stateless deleter calling a C free function, e.g. `UniquePtr<SSL, &SSL_free>`
template<auto func>
using Ftor = std::integral_constant<decltype(func), func>;

template<typename T, auto func>
using UniquePtr = std::unique_ptr<T, Ftor<func>>;

// Error description, none on success
using ErrString = std::optional<std::string>;
using Uint8View = std::basic_string_view<uint8_t>;
using Uint8Vector = std::vector<uint8_t>;

template<typename K, typename V>
using HashMap = std::unordered_map<K, V>;

using Nanos = std::chrono::nanoseconds;
using Micros = std::chrono::microseconds;
using Millis = std::chrono::milliseconds;
using Secs = std::chrono::seconds;

// A value together with the mutex guarding it
template<typename T, typename Mutex = std::mutex>
struct WithMtx {
    T val;
    Mutex mtx;
};

} // namespace qrelay
