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
#include <pthread.h>
#include <sstream>
#include <string>
#include <string_view>

#include "rawxfer/config/feature_flags.h"

#if RAWXFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace rawxfer {

/**
 * @brief Log categories
 */
struct log_category {
    static constexpr std::string_view server = "rawxfer.server";
    static constexpr std::string_view client = "rawxfer.client";
    static constexpr std::string_view dispatcher = "rawxfer.dispatcher";
    static constexpr std::string_view transfer = "rawxfer.transfer";
    static constexpr std::string_view stress = "rawxfer.stress";
};

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
 * @brief Parse a level name as given on the command line
 * @return std::nullopt for unknown names
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Escape a string for embedding in a JSON document
 */
inline std::string escape_json_string(std::string_view input) {
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

/**
 * @brief Structured fields attached to a transfer log record
 */
struct transfer_log_context {
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;
    std::optional<std::string> peer;
    std::optional<std::size_t> worker;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!filename.empty()) add_field("filename", filename);
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);
        if (peer) add_field("peer", *peer);
        if (worker) add_uint("worker", *worker);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log record
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
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << escape_json_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << escape_json_string(*source_file) << "\"";
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
 *     .with_category(log_category::transfer)
 *     .with_message("Upload stored")
 *     .with_context(ctx)
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

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
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

private:
    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class transfer_logger;

/**
 * @brief Global logger accessor
 */
transfer_logger& get_logger();

/**
 * @brief Process-wide logger
 *
 * Records go to logger_system when it is built in, otherwise to stderr.
 * Callbacks see every record that passes the level filter.
 *
 * fork() is handled through pthread_atfork: the logger's locks are held
 * across the fork, and a child process writes to stderr because the async
 * backend's worker thread does not exist there.
 */
class transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    transfer_logger() {
        if (::pthread_atfork(&before_fork, &after_fork_in_parent, &after_fork_in_child) != 0) {
            std::cerr << "rawxfer: failed to register fork handlers for the logger\n";
        }
    }
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; only the first call has an effect.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if RAWXFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if RAWXFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    void set_level(log_level level) {
        min_level_.store(level);
#if RAWXFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void enable_json_output(bool enable = true) { json_output_.store(enable); }

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

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (json_output_.load()) {
            log_json(level, category, message, context, file, line, function);
        } else {
            log_text(level, category, message, context, file, line, function);
        }
    }

    void flush() {
#if RAWXFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  const char* file,
                  int line,
                  const char* function) {

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

        auto entry = builder.build();
        std::string json_str = entry.to_json();

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#if RAWXFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), json_str);
            return;
        }
#endif
        output_to_stderr(json_str);
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const transfer_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function) {

#if RAWXFER_USE_LOGGER_SYSTEM
        if (logger_) {
            std::ostringstream oss;
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json();
            }
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
            return;
        }
#endif
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }

        output_to_stderr(oss.str());
    }

    void output_to_stderr(const std::string& msg) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cerr << msg << "\n";
    }

    static void before_fork() {
        auto& self = get_logger();
        self.callback_mutex_.lock();
        self.output_mutex_.lock();
    }

    static void after_fork_in_parent() {
        auto& self = get_logger();
        self.output_mutex_.unlock();
        self.callback_mutex_.unlock();
    }

    static void after_fork_in_child() {
        auto& self = get_logger();
        self.output_mutex_.unlock();
        self.callback_mutex_.unlock();
#if RAWXFER_USE_LOGGER_SYSTEM
        // Its worker thread was not forked; stopping it would wait forever
        (void)self.logger_.release();
#endif
    }

#if RAWXFER_USE_LOGGER_SYSTEM
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
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;
    std::mutex output_mutex_;
    std::atomic<bool> json_output_{false};
};

inline transfer_logger& get_logger() {
    static transfer_logger instance;
    return instance;
}

#define RX_LOG(level, category, message) \
    rawxfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define RX_LOG_CTX(level, category, message, context) \
    rawxfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define RX_LOG_DEBUG(category, message) \
    RX_LOG(rawxfer::log_level::debug, category, message)

#define RX_LOG_INFO(category, message) \
    RX_LOG(rawxfer::log_level::info, category, message)

#define RX_LOG_WARN(category, message) \
    RX_LOG(rawxfer::log_level::warn, category, message)

#define RX_LOG_ERROR(category, message) \
    RX_LOG(rawxfer::log_level::error, category, message)

#define RX_LOG_DEBUG_CTX(category, message, ctx) \
    RX_LOG_CTX(rawxfer::log_level::debug, category, message, ctx)

#define RX_LOG_INFO_CTX(category, message, ctx) \
    RX_LOG_CTX(rawxfer::log_level::info, category, message, ctx)

#define RX_LOG_WARN_CTX(category, message, ctx) \
    RX_LOG_CTX(rawxfer::log_level::warn, category, message, ctx)

#define RX_LOG_ERROR_CTX(category, message, ctx) \
    RX_LOG_CTX(rawxfer::log_level::error, category, message, ctx)

} // namespace rawxfer
