/**
 * @file builder.h
 * @brief Fluent builder for configured contexts.
 *
 * Collects the settings a caller would otherwise apply one by one after
 * Context::create() and validates them. Device discovery is decided when the
 * native context is created; log level and then log callback are applied to
 * the new context.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/context.h"
#include "usbkit/error.h"
#include "usbkit/types.h"
#include <nal/library.h>
#include <nal/platform.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace usbkit {

// ─────────────────────────────────────────────────────────────────────────────
// ContextBuilder
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Fluent builder for Context.
 *
 * Example:
 * @code
 *   auto ctx = usbkit::ContextBuilder()
 *       .with_log_level(usbkit::LogLevel::Info)
 *       .with_log_callback(on_log, usbkit::LogCallbackMode::Context)
 *       .build();
 *
 *   if (!ctx) {
 *       std::cerr << "Error: " << ctx.error().message() << "\n";
 *   }
 * @endcode
 */
class ContextBuilder {
public:
    ContextBuilder() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Backend
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Use an explicit native library instead of the platform backend.
     * @return Reference to this builder for chaining
     */
    ContextBuilder& with_library(std::shared_ptr<nal::INativeLibrary> library) noexcept {
        library_ = std::move(library);
        return *this;
    }

    /**
     * @brief Skip device discovery (for contexts wrapping pre-opened descriptors).
     * @return Reference to this builder for chaining
     */
    ContextBuilder& without_device_discovery() noexcept {
        no_discovery_ = true;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Set the context's native log level.
     * @return Reference to this builder for chaining
     */
    ContextBuilder& with_log_level(LogLevel level) noexcept {
        log_level_ = level;
        return *this;
    }

    /**
     * @brief Register a log callback once the context exists.
     * @param callback Callback (must not be empty)
     * @param mode Context or Global delivery
     * @return Reference to this builder for chaining
     */
    ContextBuilder& with_log_callback(LogCallback callback,
                                      LogCallbackMode mode = LogCallbackMode::Context) {
        log_callback_ = std::move(callback);
        log_mode_ = mode;
        has_log_callback_ = true;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Build
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Check if current settings would pass validation.
     */
    [[nodiscard]] bool is_valid() const {
        return validate().empty();
    }

    /**
     * @brief Validate, create the context and apply the settings.
     *
     * @return Configured context, InvalidArgument on validation failure,
     *         or the error of the failing native step
     */
    [[nodiscard]] Result<Context> build() {
        std::vector<std::string> errors = validate();
        if (!errors.empty()) {
            std::string msg = "Context configuration invalid:";
            for (const auto& err : errors) {
                msg += "\n  - " + err;
            }
            return Err(Error(ErrorCode::InvalidArgument, msg));
        }

        nal::InitOptions options;
        options.noDeviceDiscovery = no_discovery_;
        auto ctx = Context::create(library_ ? library_ : nal::Platform::library(), options);
        if (!ctx) {
            return ctx;
        }

        if (log_level_) {
            ctx->set_log_level(*log_level_);
        }
        if (has_log_callback_) {
            ctx->set_log_callback(log_callback_, log_mode_);
        }
        return ctx;
    }

    /**
     * @brief Build or throw on error.
     * @throws std::runtime_error if build() fails
     */
    [[nodiscard]] Context build_or_throw() {
        auto result = build();
        if (!result.has_value()) {
            throw std::runtime_error(result.error().format());
        }
        return std::move(result).value();
    }

private:
    [[nodiscard]] std::vector<std::string> validate() const {
        std::vector<std::string> errors;

        if (has_log_callback_ && !log_callback_) {
            errors.push_back("Log callback must not be empty");
        }
        if (log_level_) {
            int level = static_cast<int>(*log_level_);
            if (level < static_cast<int>(LogLevel::None) || level > static_cast<int>(LogLevel::Debug)) {
                errors.push_back("Log level out of range");
            }
        }
        if (has_log_callback_ &&
            log_mode_ != LogCallbackMode::Global && log_mode_ != LogCallbackMode::Context) {
            errors.push_back("Invalid log callback mode");
        }
        return errors;
    }

    std::shared_ptr<nal::INativeLibrary> library_;
    std::optional<LogLevel> log_level_;
    LogCallback log_callback_;
    LogCallbackMode log_mode_ = LogCallbackMode::Context;
    bool has_log_callback_ = false;
    bool no_discovery_ = false;
};

} // namespace usbkit
