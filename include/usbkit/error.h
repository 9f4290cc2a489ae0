/**
 * @file error.h
 * @brief Error handling for the usbkit core using C++23 std::expected.
 *
 * Provides:
 * - ErrorCode taxonomy for context, enumeration, descriptor and I/O failures
 * - Error class carrying the native status and source location
 * - Result<T> alias for std::expected<T, Error>
 * - Ok(), Err(), make_error(), native_error() helpers
 *
 * Every native call that can fail is checked and translated here; there is
 * no retry at this layer.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <nal/types.h>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <cstdint>

namespace usbkit {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Categorized error codes for Result<T> failures.
 */
enum class ErrorCode : int {
    Ok = 0,                     ///< Not stored in Error objects

    InitError = 1,              ///< Context construction failed
    EnumerationError = 2,       ///< Device listing failed
    DescriptorReadError = 3,    ///< Device descriptor could not be read
    NotFound = 4,               ///< Entity (config, interface, string) not found
    AccessError = 5,            ///< Insufficient permissions
    NativeError = 6,            ///< Any other native failure

    InvalidArgument = 100,      ///< Caller supplied an unusable argument
};

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InitError: return "InitError";
        case ErrorCode::EnumerationError: return "EnumerationError";
        case ErrorCode::DescriptorReadError: return "DescriptorReadError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AccessError: return "AccessError";
        case ErrorCode::NativeError: return "NativeError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

/**
 * @brief Classify a native failure that has no operation-specific code.
 *
 * Access maps to AccessError, NotFound to NotFound, everything else passes
 * through as NativeError.
 */
[[nodiscard]] inline constexpr ErrorCode classify_native(nal::Status status) noexcept {
    switch (status) {
        case nal::Status::Access:   return ErrorCode::AccessError;
        case nal::Status::NotFound: return ErrorCode::NotFound;
        default:                    return ErrorCode::NativeError;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error with code, native status, message and location.
 *
 * Example:
 * @code
 *   auto list = ctx.devices();
 *   if (!list) {
 *       std::cerr << list.error().format() << "\n";
 *       // EnumerationError [NoMem] at context.cpp:120 (devices): ...
 *   }
 * @endcode
 */
class Error {
public:
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , status_(nal::Status::Success)
        , message_(std::move(message))
        , location_(location)
    {}

    Error(ErrorCode code,
          nal::Status status,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , status_(status)
        , message_(std::move(message))
        , location_(location)
    {}

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    /**
     * @brief Native status behind this error (Success if none).
     */
    [[nodiscard]] nal::Status status() const noexcept { return status_; }

    /**
     * @brief Raw native status code (0 if none).
     */
    [[nodiscard]] int native_code() const noexcept { return nal::toCode(status_); }

    [[nodiscard]] const char* file() const noexcept { return location_.file_name(); }
    [[nodiscard]] uint_least32_t line() const noexcept { return location_.line(); }
    [[nodiscard]] const char* function() const noexcept { return location_.function_name(); }

    /**
     * @brief Format error for display/logging.
     * @return "CODE [Status] at file:line (func): message"
     */
    [[nodiscard]] std::string format() const {
        return std::format(
            "{} [{}] at {}:{} ({}): {}",
            error_code_name(code_),
            nal::toString(status_),
            location_.file_name(),
            location_.line(),
            location_.function_name(),
            message_
        );
    }

    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    nal::Status status_;
    std::string message_;
    std::source_location location_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
using Result = std::expected<T, Error>;

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

/**
 * @brief Build an error from a failed native return code.
 *
 * @param code Error category for this operation
 * @param rc Negative native return code
 * @param operation Name of the failed operation, used in the message
 */
[[nodiscard]] inline std::unexpected<Error> native_error(
    ErrorCode code,
    int rc,
    std::string_view operation,
    std::source_location loc = std::source_location::current()
) {
    nal::Status status = nal::statusFromCode(rc);
    return std::unexpected(Error{
        code,
        status,
        std::format("{} failed: {} ({})", operation, nal::toString(status), rc),
        loc
    });
}

/**
 * @brief Build an error from a failed native return code, classified by status.
 */
[[nodiscard]] inline std::unexpected<Error> native_error(
    int rc,
    std::string_view operation,
    std::source_location loc = std::source_location::current()
) {
    return native_error(classify_native(nal::statusFromCode(rc)), rc, operation, loc);
}

} // namespace usbkit

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return a classified error if a native call failed.
 *
 * Usage:
 *   USBKIT_CHECK_NATIVE(lib.claimInterface(h, 0), "claim_interface");
 */
#define USBKIT_CHECK_NATIVE(call, operation) \
    do { \
        int _usbkit_rc = (call); \
        if (_usbkit_rc < 0) { \
            return ::usbkit::native_error(_usbkit_rc, operation); \
        } \
    } while (0)
