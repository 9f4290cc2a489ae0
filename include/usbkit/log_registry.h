/**
 * @file log_registry.h
 * @brief Process-wide table routing native log lines to user callbacks.
 *
 * The native library calls a single function pointer (trampoline()) with the
 * originating native context address, a severity and a message. The registry
 * resolves that address to the ContextId currently bound to it and invokes the
 * callback registered for that id, falling back to the global slot.
 *
 * Keys are ContextIds rather than native addresses: when a context is
 * destroyed its binding is dropped, so a later context that lands on the same
 * address never inherits the old callback.
 *
 * Thread-safety: all table access takes one mutex. The callback is copied out
 * under the lock and invoked after releasing it, on the caller's (native)
 * thread. Delivery concurrent with a context's destruction is best-effort: a
 * line racing the removal may be dropped.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/types.h"
#include <nal/types.h>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace usbkit {

class LogCallbackRegistry {
public:
    LogCallbackRegistry() = default;

    // Non-copyable (owns callback state)
    LogCallbackRegistry(const LogCallbackRegistry&) = delete;
    LogCallbackRegistry& operator=(const LogCallbackRegistry&) = delete;

    /**
     * @brief The process-wide registry used by trampoline().
     */
    [[nodiscard]] static LogCallbackRegistry& instance();

    /**
     * @brief Function installed with the native library.
     *
     * Never throws and never aborts, whatever the input.
     */
    static void trampoline(nal::RawContext* ctx, int level, const char* text) noexcept;

    /**
     * @brief Associate a native context address with a context identity.
     *
     * Replaces any previous binding of the same address.
     */
    void bind(const nal::RawContext* ctx, ContextId id);

    /**
     * @brief Register a callback, replacing any previous one for the key.
     *
     * @param key ContextId, or GlobalContextId for the process-wide slot
     */
    void set(ContextId key, LogCallback callback);

    /**
     * @brief Remove the callback for a key.
     * @return true if an entry was removed
     */
    bool remove(ContextId key);

    /**
     * @brief Forget a context: drop its callback and its address binding.
     *
     * Called when the last owner of a context goes away, before the native
     * context is released.
     */
    void release(ContextId id);

    /**
     * @brief Route one native log line.
     *
     * Looks up the callback for the context bound to @p ctx, then the global
     * slot. Null or non-UTF-8 text is delivered as an empty string.
     *
     * @return true if a callback was invoked
     */
    bool dispatch(const nal::RawContext* ctx, int level, const char* text) noexcept;

    [[nodiscard]] bool contains(ContextId key) const;

    [[nodiscard]] size_t size() const;

    /**
     * @brief Remove every callback and binding.
     */
    void clear();

private:
    using SharedCallback = std::shared_ptr<const LogCallback>;

    SharedCallback lookup(const nal::RawContext* ctx) const;

    mutable std::mutex mutex_;
    std::unordered_map<ContextId, SharedCallback> callbacks_;
    std::unordered_map<const nal::RawContext*, ContextId> bindings_;
};

namespace detail {

/**
 * @brief Decode a native message buffer as UTF-8 text.
 * @return The text, or an empty string if null or malformed
 */
[[nodiscard]] std::string decode_log_text(const char* text);

} // namespace detail

} // namespace usbkit
