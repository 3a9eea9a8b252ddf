/**
 * @file types.h
 * @brief Core type definitions for peer_trans_system
 */

#ifndef KCENON_PEER_TRANSFER_CORE_TYPES_H
#define KCENON_PEER_TRANSFER_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::peer_transfer {

/**
 * @brief Error codes for peer transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Signaling errors
 * - -120 to -139: Connection errors
 * - -140 to -159: Channel and transfer errors
 * - -160 to -179: File errors
 * - -200 to -219: Internal errors
 */
enum class error_code {
    success = 0,

    // Signaling errors (-100 to -119)
    malformed_signal = -100,
    gathering_timeout = -101,

    // Connection errors (-120 to -139)
    negotiation_failed = -120,
    invalid_state = -121,
    backend_error = -122,

    // Channel and transfer errors (-140 to -159)
    channel_closed = -140,
    flow_control_timeout = -141,
    transfer_cancelled = -142,
    transfer_in_progress = -143,

    // File errors (-160 to -179)
    file_not_found = -160,
    file_read_error = -161,
    file_write_error = -162,

    // Internal errors (-200 to -219)
    invalid_argument = -200,
    internal_error = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::malformed_signal:
            return "malformed connection code";
        case error_code::gathering_timeout:
            return "candidate gathering timed out";
        case error_code::negotiation_failed:
            return "connection negotiation failed";
        case error_code::invalid_state:
            return "operation not valid in current state";
        case error_code::backend_error:
            return "peer backend error";
        case error_code::channel_closed:
            return "data channel is not open";
        case error_code::flow_control_timeout:
            return "send buffer did not drain in time";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::transfer_in_progress:
            return "transfer already in progress";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

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
 * Contains either a value of type T or an error, similar to std::expected.
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

/// Owned byte sequence used for chunk payloads
using byte_buffer = std::vector<std::byte>;

/**
 * @brief Direction of a transfer relative to the local peer
 */
enum class transfer_direction {
    outgoing,
    incoming
};

[[nodiscard]] constexpr auto to_string(transfer_direction direction) -> const char* {
    switch (direction) {
        case transfer_direction::outgoing: return "outgoing";
        case transfer_direction::incoming: return "incoming";
        default: return "unknown";
    }
}

/**
 * @brief Read-only progress snapshot exposed to observers
 */
struct transfer_progress {
    transfer_direction direction = transfer_direction::outgoing;
    std::string transfer_id;
    std::string file_name;
    uint64_t done_bytes = 0;
    uint64_t total_bytes = 0;

    [[nodiscard]] auto completion_percentage() const -> double {
        if (total_bytes == 0) return 0.0;
        auto percent = static_cast<double>(done_bytes) /
                       static_cast<double>(total_bytes) * 100.0;
        return percent > 100.0 ? 100.0 : percent;
    }

    [[nodiscard]] auto is_complete() const -> bool {
        return done_bytes >= total_bytes;
    }
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_TYPES_H
