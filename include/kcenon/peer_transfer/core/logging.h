// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/peer_transfer/core/json_utils.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define PEER_TRANSFER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::peer_transfer {

/**
 * @brief Log categories for the peer transfer system
 */
struct log_category {
    static constexpr std::string_view signal = "peer_transfer.signal";
    static constexpr std::string_view connection = "peer_transfer.connection";
    static constexpr std::string_view channel = "peer_transfer.channel";
    static constexpr std::string_view protocol = "peer_transfer.protocol";
    static constexpr std::string_view session = "peer_transfer.session";
    static constexpr std::string_view backend = "peer_transfer.backend";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

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

/**
 * @brief Configuration for sensitive information masking
 *
 * Connection codes embed ICE candidates, so peer addresses end up in log
 * lines whenever descriptors are traced.
 */
struct masking_config {
    bool mask_ips = false;
    bool mask_filenames = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks IP addresses and file names in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask every IPv4 address found in a message
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_ips) {
            return input;
        }

        static const std::regex ip_pattern(
            R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), ip_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_ip(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    /**
     * @brief Mask an IP address, keeping only the last octet
     */
    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string {
        if (!config_.mask_ips || ip.empty()) {
            return ip;
        }

        auto last_dot = ip.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(ip.size(), config_.mask_char[0]);
        }

        std::string masked_prefix(last_dot, config_.mask_char[0]);
        return masked_prefix + ip.substr(last_dot);
    }

    /**
     * @brief Mask a file name, keeping a prefix and the extension
     */
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames || filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        std::string name = filename;
        std::string ext;
        if (dot_pos != std::string::npos && dot_pos > 0) {
            name = filename.substr(0, dot_pos);
            ext = filename.substr(dot_pos);
        }

        if (name.size() <= config_.visible_chars) {
            return filename;
        }

        std::string visible = name.substr(0, config_.visible_chars);
        std::string masked(name.size() - config_.visible_chars, config_.mask_char[0]);
        return visible + masked + ext;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for transfer and connection events
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> buffered_amount;
    std::optional<double> progress_percent;
    std::optional<std::string> state;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << json::escape(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!transfer_id.empty()) add_field("transfer_id", transfer_id);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_filename(filename) : filename);
        }
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (buffered_amount) add_uint("buffered_amount", *buffered_amount);
        if (progress_percent) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2)
                << "\"progress_percent\":" << *progress_percent;
            first = false;
        }
        if (state) add_field("state", *state);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
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

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << json::escape(masker ? masker->mask(message) : message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << json::escape(*source_file) << "\"";
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
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::session)
 *     .with_message("file received")
 *     .with_transfer_id(id)
 *     .with_filename("photo.jpg")
 *     .with_file_size(51200)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_transfer_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->transfer_id = std::string(id);
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context();
        entry_.context->filename = std::string(filename);
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        ensure_context();
        entry_.context->file_size = size;
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_transferred = bytes;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the peer transfer system
 */
class peer_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    peer_transfer_logger() = default;
    ~peer_transfer_logger() = default;

    peer_transfer_logger(const peer_transfer_logger&) = delete;
    peer_transfer_logger& operator=(const peer_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; called when a session is created.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef PEER_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(kcenon::logger::log_level::info)
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef PEER_TRANSFER_USE_LOGGER_SYSTEM
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
#ifdef PEER_TRANSFER_USE_LOGGER_SYSTEM
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

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a callback that observes every emitted record
     *
     * Passing nullptr removes the callback.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress stderr output (records still reach the callback)
     */
    void set_console_output(bool enable) { console_output_.store(enable); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

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

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string line_out;
        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            line_out = builder.build().to_json_with_masking(&current_masker);
        } else {
            std::ostringstream oss;
            oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
                << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            line_out = oss.str();
        }

#ifdef PEER_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_out, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_out);
            }
            return;
        }
#endif
        if (console_output_.load()) {
            output_to_stderr(line_out);
        }
    }

    void flush() {
#ifdef PEER_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#ifdef PEER_TRANSFER_USE_LOGGER_SYSTEM
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

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline peer_transfer_logger& get_logger() {
    static peer_transfer_logger instance;
    return instance;
}

#define PT_LOG(level, category, message) \
    kcenon::peer_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define PT_LOG_CTX(level, category, message, context) \
    kcenon::peer_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define PT_LOG_TRACE(category, message) \
    PT_LOG(kcenon::peer_transfer::log_level::trace, category, message)

#define PT_LOG_DEBUG(category, message) \
    PT_LOG(kcenon::peer_transfer::log_level::debug, category, message)

#define PT_LOG_INFO(category, message) \
    PT_LOG(kcenon::peer_transfer::log_level::info, category, message)

#define PT_LOG_WARN(category, message) \
    PT_LOG(kcenon::peer_transfer::log_level::warn, category, message)

#define PT_LOG_ERROR(category, message) \
    PT_LOG(kcenon::peer_transfer::log_level::error, category, message)

#define PT_LOG_DEBUG_CTX(category, message, ctx) \
    PT_LOG_CTX(kcenon::peer_transfer::log_level::debug, category, message, ctx)

#define PT_LOG_INFO_CTX(category, message, ctx) \
    PT_LOG_CTX(kcenon::peer_transfer::log_level::info, category, message, ctx)

#define PT_LOG_WARN_CTX(category, message, ctx) \
    PT_LOG_CTX(kcenon::peer_transfer::log_level::warn, category, message, ctx)

#define PT_LOG_ERROR_CTX(category, message, ctx) \
    PT_LOG_CTX(kcenon::peer_transfer::log_level::error, category, message, ctx)

} // namespace kcenon::peer_transfer
