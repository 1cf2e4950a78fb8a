// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::media_transfer {

/**
 * @brief Log categories for the media transfer engine
 */
struct log_category {
    static constexpr std::string_view engine = "media_transfer.engine";
    static constexpr std::string_view registry = "media_transfer.registry";
    static constexpr std::string_view upload = "media_transfer.upload";
    static constexpr std::string_view download = "media_transfer.download";
    static constexpr std::string_view stream = "media_transfer.stream";
    static constexpr std::string_view scheduler = "media_transfer.scheduler";
    static constexpr std::string_view storage = "media_transfer.storage";
};

/**
 * @brief Log levels for the media transfer engine
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

inline auto format_time(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (utc) {
        gmtime_s(&tm_buf, &time_t_val);
    } else {
        localtime_s(&tm_buf, &time_t_val);
    }
#else
    if (utc) {
        gmtime_r(&time_t_val, &tm_buf);
    } else {
        localtime_r(&time_t_val, &tm_buf);
    }
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) {
        oss << 'Z';
    }
    return oss.str();
}

}  // namespace detail

/**
 * @brief Structured log context for media transfer operations
 */
struct transfer_log_context {
    std::string file_key;
    std::optional<int64_t> part_index;
    std::optional<int64_t> parts_count;
    std::optional<uint32_t> progress;
    std::optional<std::size_t> lane;
    std::optional<int64_t> message_id;
    std::optional<int64_t> folder_id;
    std::optional<uint64_t> bytes;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto separator = [&]() {
            if (!first) oss << ",";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            separator();
            oss << "\"" << name << "\":" << value;
        };

        if (!file_key.empty()) {
            separator();
            oss << "\"file_key\":\"" << detail::escape_json(file_key) << "\"";
        }
        if (part_index) add_int("part", *part_index);
        if (parts_count) add_int("parts_count", *parts_count);
        if (progress) add_int("progress", static_cast<int64_t>(*progress));
        if (lane) add_int("lane", static_cast<int64_t>(*lane));
        if (message_id) add_int("message_id", *message_id);
        if (folder_id) add_int("folder_id", *folder_id);
        if (bytes) add_int("bytes", static_cast<int64_t>(*bytes));
        if (error_message) {
            separator();
            oss << "\"error_message\":\"" << detail::escape_json(*error_message) << "\"";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    /**
     * @brief Convert to complete JSON format
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Media transfer logging interface
 *
 * Routes through logger_system when it is available, otherwise writes to
 * stderr. Callbacks receive every accepted record regardless of the sink.
 */
class media_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    media_transfer_logger() = default;
    ~media_transfer_logger() = default;

    media_transfer_logger(const media_transfer_logger&) = delete;
    media_transfer_logger& operator=(const media_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when an engine is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            logger_ = std::move(result.value());
        }
#endif
    }

    /**
     * @brief Shutdown the logger
     */
    void shutdown() {
#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    /**
     * @brief Suppress the stderr/logger_system sink, keeping callbacks
     */
    void set_sink_enabled(bool enabled) { sink_enabled_.store(enabled); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (get_output_format() == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = detail::format_time(true);
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;

            std::string json_str = entry.to_json();
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json_str);
                }
            }
            write(level, json_str, file, line, function);
            return;
        }

        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        write(level, oss.str(), file, line, function);
    }

    void flush() {
#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level,
               const std::string& text,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
        if (!sink_enabled_.load()) return;

        const bool json = get_output_format() == log_output_format::json;
        std::lock_guard<std::mutex> lock(sink_mutex_);
#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#endif
        if (json) {
            std::cerr << text << "\n";
        } else {
            std::cerr << detail::format_time(false) << " [" << log_level_to_string(level)
                      << "] " << text << "\n";
        }
    }

#if MEDIA_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> sink_enabled_{true};

    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;
    std::mutex sink_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline media_transfer_logger& get_logger() {
    static media_transfer_logger instance;
    return instance;
}

// Logging macros for convenience
#define MT_LOG(level, category, message) \
    kcenon::media_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define MT_LOG_CTX(level, category, message, context) \
    kcenon::media_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define MT_LOG_TRACE(category, message) \
    MT_LOG(kcenon::media_transfer::log_level::trace, category, message)

#define MT_LOG_DEBUG(category, message) \
    MT_LOG(kcenon::media_transfer::log_level::debug, category, message)

#define MT_LOG_INFO(category, message) \
    MT_LOG(kcenon::media_transfer::log_level::info, category, message)

#define MT_LOG_WARN(category, message) \
    MT_LOG(kcenon::media_transfer::log_level::warn, category, message)

#define MT_LOG_ERROR(category, message) \
    MT_LOG(kcenon::media_transfer::log_level::error, category, message)

#define MT_LOG_DEBUG_CTX(category, message, ctx) \
    MT_LOG_CTX(kcenon::media_transfer::log_level::debug, category, message, ctx)

#define MT_LOG_INFO_CTX(category, message, ctx) \
    MT_LOG_CTX(kcenon::media_transfer::log_level::info, category, message, ctx)

#define MT_LOG_WARN_CTX(category, message, ctx) \
    MT_LOG_CTX(kcenon::media_transfer::log_level::warn, category, message, ctx)

#define MT_LOG_ERROR_CTX(category, message, ctx) \
    MT_LOG_CTX(kcenon::media_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::media_transfer
