/**
 * @file types.h
 * @brief Core type definitions for task_session
 */

#ifndef KCENON_TASK_SESSION_CORE_TYPES_H
#define KCENON_TASK_SESSION_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::task_session {

/**
 * @brief Error codes for task session operations (-800 to -899)
 *
 * Error code ranges:
 * - -800 to -809: Argument Errors
 * - -810 to -819: Registry Errors
 * - -820 to -829: Transport Errors
 * - -830 to -839: Cancellation
 * - -840 to -849: Authentication Errors
 * - -850 to -859: Session Errors
 * - -860 to -869: File Errors
 * - -890 to -899: Internal Errors
 */
enum class error_code : int32_t {
    success = 0,

    // Argument Errors (-800 to -809)
    invalid_argument = -800,
    invalid_url = -801,
    invalid_resume_data = -802,
    invalid_upload_body = -803,

    // Registry Errors (-810 to -819)
    duplicate_identifier = -810,
    operation_not_found = -811,

    // Transport Errors (-820 to -829)
    transport_error = -820,
    connection_failed = -821,
    connection_timeout = -822,
    connection_lost = -823,
    host_not_found = -824,
    bad_server_response = -825,
    transport_unavailable = -826,

    // Cancellation (-830 to -839)
    cancelled = -830,

    // Authentication Errors (-840 to -849)
    authentication_failed = -840,

    // Session Errors (-850 to -859)
    session_invalidated = -850,

    // File Errors (-860 to -869)
    file_not_found = -860,
    file_read_error = -861,
    file_write_error = -862,

    // Internal Errors (-890 to -899)
    internal_error = -890,
    not_initialized = -891,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_url:
            return "invalid url";
        case error_code::invalid_resume_data:
            return "invalid resume data";
        case error_code::invalid_upload_body:
            return "invalid upload body";
        case error_code::duplicate_identifier:
            return "task identifier already registered";
        case error_code::operation_not_found:
            return "operation not found";
        case error_code::transport_error:
            return "transport error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::host_not_found:
            return "host not found";
        case error_code::bad_server_response:
            return "bad server response";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::cancelled:
            return "cancelled";
        case error_code::authentication_failed:
            return "authentication failed";
        case error_code::session_invalidated:
            return "session invalidated";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in argument error range
 */
[[nodiscard]] constexpr auto is_argument_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -800 && value >= -809;
}

/**
 * @brief Check if error code is in transport error range
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -820 && value >= -829;
}

/**
 * @brief Check if error code is in file error range
 */
[[nodiscard]] constexpr auto is_file_error(error_code code) noexcept -> bool {
    auto value = static_cast<int32_t>(code);
    return value <= -860 && value >= -869;
}

/**
 * @brief Opaque bytes produced by a cancelled download for later continuation
 */
using resume_data = std::vector<std::byte>;

/**
 * @brief Error type with code and optional message
 *
 * A cancelled download that produced resume data carries it in
 * `resume_data`; every other error leaves it empty.
 */
struct error {
    error_code code;
    std::string message;
    std::optional<task_session::resume_data> resume_data;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Identifier assigned by the transport to one transport task
 *
 * Unique for the lifetime of a session. The value itself carries no
 * meaning beyond identity.
 */
struct task_identifier {
    uint64_t value;

    task_identifier() : value(0) {}
    explicit task_identifier(uint64_t v) : value(v) {}

    [[nodiscard]] auto operator==(const task_identifier& other) const -> bool = default;
    [[nodiscard]] auto operator<(const task_identifier& other) const -> bool {
        return value < other.value;
    }

    [[nodiscard]] auto to_string() const -> std::string {
        return std::to_string(value);
    }
};

/**
 * @brief Byte buffer used for payloads
 */
using byte_buffer = std::vector<std::byte>;

}  // namespace kcenon::task_session

// Hash support for task_identifier
template <>
struct std::hash<kcenon::task_session::task_identifier> {
    auto operator()(const kcenon::task_session::task_identifier& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // KCENON_TASK_SESSION_CORE_TYPES_H
