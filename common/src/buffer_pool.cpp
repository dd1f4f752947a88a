#include "qrelay/common/buffer_pool.h"
#include <memory>
#include <utility>

namespace qrelay {

struct BufferPool::State {
    size_t max_free;
    size_t allocated = 0;
    std::list<std::unique_ptr<uint8_t[]>> free_list;
    mutable std::mutex mtx;

    void release(std::unique_ptr<uint8_t[]> data) {
        std::scoped_lock l(mtx);
        if (free_list.size() < max_free) {
            free_list.emplace_back(std::move(data));
        }
    }
};

BufferPool::Handle::Handle(std::shared_ptr<State> state, std::unique_ptr<uint8_t[]> data, size_t capacity)
        : m_state(std::move(state))
        , m_data(std::move(data))
        , m_capacity(capacity) {
}

BufferPool::Handle::~Handle() {
    reset();
}

BufferPool::Handle::Handle(Handle &&other) noexcept
        : m_state(std::move(other.m_state))
        , m_data(std::move(other.m_data))
        , m_capacity(std::exchange(other.m_capacity, 0)) {
}

BufferPool::Handle &BufferPool::Handle::operator=(Handle &&other) noexcept {
    if (this != &other) {
        reset();
        m_state = std::move(other.m_state);
        m_data = std::move(other.m_data);
        m_capacity = std::exchange(other.m_capacity, 0);
    }
    return *this;
}

void BufferPool::Handle::reset() {
    if (m_data != nullptr && m_state != nullptr) {
        m_state->release(std::move(m_data));
    }
    m_data.reset();
    m_state.reset();
    m_capacity = 0;
}

BufferPool::BufferPool(size_t buffer_size, size_t max_free)
        : m_buffer_size(buffer_size)
        , m_state(std::make_shared<State>()) {
    m_state->max_free = max_free;
}

BufferPool::Handle BufferPool::acquire() {
    std::unique_ptr<uint8_t[]> data;
    {
        std::scoped_lock l(m_state->mtx);
        if (!m_state->free_list.empty()) {
            data = std::move(m_state->free_list.front());
            m_state->free_list.pop_front();
        } else {
            ++m_state->allocated;
        }
    }
    if (data == nullptr) {
        data = std::make_unique_for_overwrite<uint8_t[]>(m_buffer_size);
    }
    return Handle{m_state, std::move(data), m_buffer_size};
}

size_t BufferPool::free_count() const {
    std::scoped_lock l(m_state->mtx);
    return m_state->free_list.size();
}

size_t BufferPool::allocated() const {
    std::scoped_lock l(m_state->mtx);
    return m_state->allocated;
}

} // namespace qrelay
