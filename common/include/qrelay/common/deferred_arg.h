#pragma once

namespace qrelay {

/**
 * Registry of objects referenced from libevent callbacks.
 * A callback gets a token instead of `this`. Once the object is gone, the token resolves to null.
 */
class DeferredArg {
public:
    /**
     * Register an object
     * @return token for `ptr`
     */
    static void *create(void *ptr);

    /**
     * @return the object registered under `token`, or null if it has been unregistered
     */
    template <typename T>
    static T *resolve(void *token) {
        return static_cast<T *>(lookup(token));
    }

    static void destroy(void *token);

    /**
     * Holds a registration for the lifetime of its owner
     */
    class Guard {
    public:
        explicit Guard(void *ptr)
                : m_token(create(ptr)) {
        }

        ~Guard() {
            destroy(m_token);
        }

        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;
        Guard(Guard &&) = delete;
        Guard &operator=(Guard &&) = delete;

        [[nodiscard]] void *token() const {
            return m_token;
        }

    private:
        void *m_token;
    };

private:
    static void *lookup(void *token);
};

} // namespace qrelay
