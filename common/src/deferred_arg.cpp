#include <atomic>
#include <cstdint>
#include <mutex>

#include "qrelay/common/defs.h"
#include "qrelay/common/deferred_arg.h"

namespace qrelay {

// Tokens are never reused, so a stale one cannot resolve to a newer object
static std::atomic<uintptr_t> g_next_token{1};
static WithMtx<HashMap<uintptr_t, void *>> g_registry;

void *DeferredArg::create(void *ptr) {
    uintptr_t token = g_next_token.fetch_add(1, std::memory_order_relaxed);
    std::scoped_lock l(g_registry.mtx);
    g_registry.val.emplace(token, ptr);
    return (void *) token;
}

void DeferredArg::destroy(void *token) {
    std::scoped_lock l(g_registry.mtx);
    g_registry.val.erase((uintptr_t) token);
}

void *DeferredArg::lookup(void *token) {
    std::scoped_lock l(g_registry.mtx);
    auto it = g_registry.val.find((uintptr_t) token);
    return (it != g_registry.val.end()) ? it->second : nullptr;
}

} // namespace qrelay
