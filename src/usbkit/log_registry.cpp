/**
 * @file log_registry.cpp
 * @brief Implementation of the native log callback registry.
 *
 * @copyright GPL-2.0-or-later
 */

#include "usbkit/log_registry.h"
#include "usbkit/logging.h"

#include <cstdio>
#include <cstring>
#include <exception>

namespace usbkit {

namespace detail {

namespace {

/**
 * @brief Validate a UTF-8 byte sequence (no overlongs, surrogates or
 * code points above U+10FFFF).
 */
bool is_valid_utf8(const unsigned char* s, size_t len) noexcept {
    size_t i = 0;
    while (i < len) {
        unsigned char c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t cp = 0;
        uint32_t min = 0;
        if ((c & 0xE0) == 0xC0) {
            extra = 1; cp = c & 0x1F; min = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2; cp = c & 0x0F; min = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3; cp = c & 0x07; min = 0x10000;
        } else {
            return false;
        }

        if (i + extra >= len) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // anonymous namespace

std::string decode_log_text(const char* text) {
    if (!text) {
        return {};
    }
    size_t len = std::strlen(text);
    if (!is_valid_utf8(reinterpret_cast<const unsigned char*>(text), len)) {
        return {};
    }
    return std::string(text, len);
}

} // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// Process-Wide Instance
// ─────────────────────────────────────────────────────────────────────────────

LogCallbackRegistry& LogCallbackRegistry::instance() {
    static LogCallbackRegistry registry;
    return registry;
}

void LogCallbackRegistry::trampoline(nal::RawContext* ctx, int level, const char* text) noexcept {
    instance().dispatch(ctx, level, text);
}

// ─────────────────────────────────────────────────────────────────────────────
// Table Mutation
// ─────────────────────────────────────────────────────────────────────────────

void LogCallbackRegistry::bind(const nal::RawContext* ctx, ContextId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bindings_[ctx] = id;
}

void LogCallbackRegistry::set(ContextId key, LogCallback callback) {
    auto shared = std::make_shared<const LogCallback>(std::move(callback));
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_[key] = std::move(shared);
}

bool LogCallbackRegistry::remove(ContextId key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.erase(key) != 0;
}

void LogCallbackRegistry::release(ContextId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
    for (auto it = bindings_.begin(); it != bindings_.end(); ) {
        if (it->second == id) {
            it = bindings_.erase(it);
        } else {
            ++it;
        }
    }
}

bool LogCallbackRegistry::contains(ContextId key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.count(key) != 0;
}

size_t LogCallbackRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
}

void LogCallbackRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.clear();
    bindings_.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch
// ─────────────────────────────────────────────────────────────────────────────

LogCallbackRegistry::SharedCallback LogCallbackRegistry::lookup(const nal::RawContext* ctx) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx) {
        auto binding = bindings_.find(ctx);
        if (binding != bindings_.end()) {
            auto it = callbacks_.find(binding->second);
            if (it != callbacks_.end()) {
                return it->second;
            }
        }
    }

    auto global = callbacks_.find(GlobalContextId);
    if (global != callbacks_.end()) {
        return global->second;
    }
    return nullptr;
}

bool LogCallbackRegistry::dispatch(const nal::RawContext* ctx, int level, const char* text) noexcept {
    // Runs on a native library thread: nothing may escape from here
    try {
        SharedCallback callback = lookup(ctx);
        if (!callback || !*callback) {
            return false;
        }
        (*callback)(log_level_from_native(level), detail::decode_log_text(text));
        return true;
    } catch (const std::exception& e) {
        char buffer[256];
        std::snprintf(buffer, sizeof(buffer), "log callback threw: %s", e.what());
        log_raw(LogLevel::Error, "log", buffer);
    } catch (...) {
        log_raw(LogLevel::Error, "log", "log callback threw a non-standard exception");
    }
    return false;
}

} // namespace usbkit
