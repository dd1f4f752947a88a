#pragma once

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>

#include "qrelay/common/defs.h"

namespace qrelay {

/**
 * Bounded free-list of fixed-size byte buffers.
 * Buffers are checked out with `acquire()` and go back to the pool when the handle is destroyed,
 * even if the pool itself is already gone.
 */
class BufferPool {
private:
    struct State;

public:
    /**
     * Exclusively owned buffer checked out of the pool
     */
    class Handle {
    public:
        Handle() = default;
        ~Handle();

        Handle(Handle &&other) noexcept;
        Handle &operator=(Handle &&other) noexcept;
        Handle(const Handle &) = delete;
        Handle &operator=(const Handle &) = delete;

        [[nodiscard]] uint8_t *data() const {
            return m_data.get();
        }

        [[nodiscard]] size_t capacity() const {
            return m_capacity;
        }

        explicit operator bool() const {
            return m_data != nullptr;
        }

        /**
         * Give the buffer back to the pool ahead of destruction
         */
        void reset();

    private:
        friend class BufferPool;

        std::shared_ptr<State> m_state;
        std::unique_ptr<uint8_t[]> m_data;
        size_t m_capacity = 0;

        Handle(std::shared_ptr<State> state, std::unique_ptr<uint8_t[]> data, size_t capacity);
    };

    /**
     * @param buffer_size size of one buffer
     * @param max_free    number of idle buffers kept for reuse, extra ones are freed on release
     */
    BufferPool(size_t buffer_size, size_t max_free);
    ~BufferPool() = default;

    BufferPool(const BufferPool &) = delete;
    BufferPool &operator=(const BufferPool &) = delete;
    BufferPool(BufferPool &&) = delete;
    BufferPool &operator=(BufferPool &&) = delete;

    /**
     * Check out a buffer. If there are no idle buffers, a new one is allocated.
     */
    [[nodiscard]] Handle acquire();

    /**
     * @return number of idle buffers
     */
    [[nodiscard]] size_t free_count() const;

    /**
     * @return number of buffers allocated by the pool during its lifetime
     */
    [[nodiscard]] size_t allocated() const;

    [[nodiscard]] size_t buffer_size() const {
        return m_buffer_size;
    }

private:
    size_t m_buffer_size;
    std::shared_ptr<State> m_state;
};

} // namespace qrelay
