/**
 * @file types.h
 * @brief Core type definitions for media_trans_system
 */

#ifndef KCENON_MEDIA_TRANSFER_CORE_TYPES_H
#define KCENON_MEDIA_TRANSFER_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::media_transfer {

/**
 * @brief Raw byte buffer used for file parts and file references
 */
using byte_buffer = std::vector<std::byte>;

/**
 * @brief Transport error message that marks an expired file reference
 *
 * This is the only transport error the engine distinguishes; all other
 * failures are opaque and never retried automatically.
 */
inline constexpr std::string_view file_reference_expired_message = "FILE_REFERENCE_EXPIRED";

/**
 * @brief Error codes for media transfer operations
 */
enum class error_code {
    success = 0,

    // Part storage errors (-100 to -119)
    file_not_staged = -100,
    part_out_of_range = -101,
    part_read_error = -102,
    part_write_error = -103,
    assemble_failed = -104,

    // Transport errors (-120 to -139)
    transport_failed = -120,
    file_reference_expired = -121,
    prepare_upload_failed = -122,
    upload_part_failed = -123,
    download_part_failed = -124,

    // Registry and ownership errors (-140 to -159)
    entry_not_found = -140,
    message_not_found = -141,
    media_not_found = -142,
    no_active_folder = -143,

    // Configuration errors (-160 to -179)
    invalid_configuration = -160,
    invalid_lane_count = -161,
    invalid_part_size = -162,
    missing_collaborator = -163,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_staged:
            return "file not staged";
        case error_code::part_out_of_range:
            return "part out of range";
        case error_code::part_read_error:
            return "part read error";
        case error_code::part_write_error:
            return "part write error";
        case error_code::assemble_failed:
            return "assemble failed";
        case error_code::transport_failed:
            return "transport failed";
        case error_code::file_reference_expired:
            return "file reference expired";
        case error_code::prepare_upload_failed:
            return "prepare upload failed";
        case error_code::upload_part_failed:
            return "upload part failed";
        case error_code::download_part_failed:
            return "download part failed";
        case error_code::entry_not_found:
            return "entry not found";
        case error_code::message_not_found:
            return "message not found";
        case error_code::media_not_found:
            return "media not found";
        case error_code::no_active_folder:
            return "no active folder";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_lane_count:
            return "invalid lane count";
        case error_code::invalid_part_size:
            return "invalid part size";
        case error_code::missing_collaborator:
            return "missing collaborator";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
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
 * @brief Check whether a transport failure signals an expired file reference
 */
[[nodiscard]] inline auto is_file_reference_expired(const error& err) -> bool {
    return err.message == file_reference_expired_message ||
           err.code == error_code::file_reference_expired;
}

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

}  // namespace kcenon::media_transfer

#endif  // KCENON_MEDIA_TRANSFER_CORE_TYPES_H
