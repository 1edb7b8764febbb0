// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include "../config/feature_flags.h"

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

#include <nlohmann/json.hpp>

#if LOCBRIDGE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace locbridge {

/**
 * @brief Log categories for locbridge
 */
struct log_category {
    static constexpr std::string_view client = "locbridge.client";
    static constexpr std::string_view transport = "locbridge.transport";
    static constexpr std::string_view retry = "locbridge.retry";
    static constexpr std::string_view poller = "locbridge.poller";
    static constexpr std::string_view upload = "locbridge.upload";
    static constexpr std::string_view download = "locbridge.download";
    static constexpr std::string_view extract = "locbridge.extract";
};

/**
 * @brief Log levels for locbridge
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
 * @brief What the masker hides in log output
 *
 * Tokens and signed URL query strings are masked by default; local paths
 * are kept unless explicitly requested.
 */
struct masking_config {
    bool mask_tokens = true;
    bool mask_query_strings = true;
    bool mask_paths = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, '*', 4};
    }
};

/**
 * @brief Masks credentials and signed download URLs in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = {})
        : config_(config) {}

    /**
     * @brief Mask everything enabled in the configuration
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;
        if (config_.mask_tokens) {
            result = replace_all(result, token_pattern(), [this](const std::smatch& m) {
                return m.str(1) + mask_token(m.str(2));
            });
        }
        if (config_.mask_query_strings) {
            result = replace_all(result, query_pattern(), [this](const std::smatch& m) {
                return m.str(1) + "?" + std::string(3, config_.mask_char);
            });
        }
        if (config_.mask_paths) {
            result = replace_all(result, path_pattern(), [this](const std::smatch& m) {
                return mask_path(m.str(0));
            });
        }
        return result;
    }

    /**
     * @brief Keep the first visible_chars characters of a secret
     */
    [[nodiscard]] auto mask_token(const std::string& token) const -> std::string {
        if (!config_.mask_tokens || token.empty()) {
            return token;
        }
        auto visible = std::min(config_.visible_chars, token.size() / 2);
        return token.substr(0, visible) + std::string(token.size() - visible, config_.mask_char);
    }

    /**
     * @brief Mask the directory part of a path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char) + "/" + path.substr(last_sep + 1);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    static auto token_pattern() -> const std::regex& {
        static const std::regex pattern(R"(((?:X-Api-Token|token)["']?\s*[:=]\s*["']?)([A-Za-z0-9_\-\.]+))",
                                        std::regex::icase);
        return pattern;
    }

    static auto query_pattern() -> const std::regex& {
        static const std::regex pattern(R"((https?://[^\s?#"]+)\?[^\s#"]*)");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(R"((?:/[A-Za-z0-9._-]+){2,})");
        return pattern;
    }

    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn&& fn)
        -> std::string {
        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;
        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, static_cast<size_t>(it->position()) - last_pos);
            out += fn(*it);
            last_pos = static_cast<size_t>(it->position() + it->length());
        }
        out += input.substr(last_pos);
        return out;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to a log record
 */
struct request_log_context {
    std::string operation;
    std::optional<std::string> process_id;
    std::optional<std::string> url;
    std::optional<std::string> path;
    std::optional<int> http_status;
    std::optional<uint32_t> attempt;
    std::optional<uint32_t> max_attempts;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> nlohmann::json {
        auto masked = [masker](const std::string& s) {
            return masker ? masker->mask(s) : s;
        };

        nlohmann::json out = nlohmann::json::object();
        if (!operation.empty()) out["operation"] = operation;
        if (process_id) out["process_id"] = *process_id;
        if (url) out["url"] = masked(*url);
        if (path) out["path"] = masker ? masker->mask_path(*path) : *path;
        if (http_status) out["http_status"] = *http_status;
        if (attempt) out["attempt"] = *attempt;
        if (max_attempts) out["max_attempts"] = *max_attempts;
        if (bytes) out["bytes"] = *bytes;
        if (duration_ms) out["duration_ms"] = *duration_ms;
        if (error_message) out["error_message"] = masked(*error_message);
        return out;
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
    std::optional<request_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        nlohmann::json out;
        out["timestamp"] = timestamp;
        out["level"] = std::string(log_level_to_string(level));
        out["category"] = category;
        out["message"] = masker ? masker->mask(message) : message;
        if (context) {
            out.update(context->to_json(masker));
        }
        if (source_file) {
            nlohmann::json source{{"file", *source_file}};
            if (source_line) source["line"] = *source_line;
            if (function_name) source["function"] = *function_name;
            out["source"] = std::move(source);
        }
        return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for locbridge
 *
 * Forwards to an async logger_system logger when it is available, otherwise
 * writes to stderr. All messages pass through the sensitive_info_masker.
 */
class exchange_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const request_log_context*)>;

    exchange_logger() = default;
    ~exchange_logger() = default;

    exchange_logger(const exchange_logger&) = delete;
    exchange_logger& operator=(const exchange_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; called by exchange_client construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if LOCBRIDGE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if LOCBRIDGE_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
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
#if LOCBRIDGE_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
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
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Observe every enabled record (used by tests and host tools)
     *
     * The callback receives the masked message.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const request_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string masked = masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        std::string line_out;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = timestamp(true);
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;
            line_out = entry.to_json(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masked;
            if (context) {
                oss << " " << context->to_json(&masker).dump(-1, ' ', false,
                                                            nlohmann::json::error_handler_t::replace);
            }
            line_out = oss.str();
        }

        emit(level, line_out, file, line, function);
    }

    void flush() {
#if LOCBRIDGE_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level,
              const std::string& text,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if LOCBRIDGE_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#endif
        std::ostringstream oss;
        if (get_output_format() == log_output_format::json) {
            oss << text;
        } else {
            oss << timestamp(false) << " [" << log_level_to_string(level) << "] " << text;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << oss.str() << "\n";
    }

#if LOCBRIDGE_USE_LOGGER_SYSTEM
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
    std::mutex backend_mutex_;
#endif

    static auto timestamp(bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        if (utc) {
            gmtime_r(&time_t_val, &tm_buf);
        } else {
            localtime_r(&time_t_val, &tm_buf);
        }

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        if (utc) oss << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline exchange_logger& get_logger() {
    static exchange_logger instance;
    return instance;
}

// Logging macros for convenience
#define LB_LOG(level, category, message) \
    ::locbridge::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define LB_LOG_CTX(level, category, message, context) \
    ::locbridge::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define LB_LOG_TRACE(category, message) \
    LB_LOG(::locbridge::log_level::trace, category, message)

#define LB_LOG_DEBUG(category, message) \
    LB_LOG(::locbridge::log_level::debug, category, message)

#define LB_LOG_INFO(category, message) \
    LB_LOG(::locbridge::log_level::info, category, message)

#define LB_LOG_WARN(category, message) \
    LB_LOG(::locbridge::log_level::warn, category, message)

#define LB_LOG_ERROR(category, message) \
    LB_LOG(::locbridge::log_level::error, category, message)

#define LB_LOG_DEBUG_CTX(category, message, ctx) \
    LB_LOG_CTX(::locbridge::log_level::debug, category, message, ctx)

#define LB_LOG_INFO_CTX(category, message, ctx) \
    LB_LOG_CTX(::locbridge::log_level::info, category, message, ctx)

#define LB_LOG_WARN_CTX(category, message, ctx) \
    LB_LOG_CTX(::locbridge::log_level::warn, category, message, ctx)

#define LB_LOG_ERROR_CTX(category, message, ctx) \
    LB_LOG_CTX(::locbridge::log_level::error, category, message, ctx)

}  // namespace locbridge
