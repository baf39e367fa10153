// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
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
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/resilient_transfer/config/feature_flags.h"

// logger_system integration requires common_system
#if KCENON_WITH_LOGGER_SYSTEM && defined(BUILD_WITH_COMMON_SYSTEM)
#define RESILIENT_TRANSFER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::resilient_transfer {

/**
 * @brief Log categories for the transfer engine
 */
struct log_category {
    static constexpr std::string_view manager = "resilient_transfer.manager";
    static constexpr std::string_view upload = "resilient_transfer.upload";
    static constexpr std::string_view download = "resilient_transfer.download";
    static constexpr std::string_view resume = "resilient_transfer.resume";
    static constexpr std::string_view credentials = "resilient_transfer.credentials";
    static constexpr std::string_view rate_limit = "resilient_transfer.rate_limit";
    static constexpr std::string_view retry = "resilient_transfer.retry";
    static constexpr std::string_view cipher = "resilient_transfer.cipher";
    static constexpr std::string_view events = "resilient_transfer.events";
    static constexpr std::string_view disk = "resilient_transfer.disk";
    static constexpr std::string_view storage = "resilient_transfer.storage";
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

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Secrets (credential keys, session and SAS tokens) are masked by default.
 * Local paths are only masked on request.
 */
struct masking_config {
    bool mask_secrets = true;
    bool mask_paths = false;
    bool mask_filenames = false;
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
 * @brief Masks secrets and local paths in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = {})
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string out = input;
        if (config_.mask_secrets) {
            out = mask_secret_assignments(out);
        }
        if (config_.mask_paths) {
            out = mask_file_paths(out);
        }
        return out;
    }

    /**
     * @brief Mask a secret value, keeping only its first characters visible
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (secret.empty()) {
            return secret;
        }
        const auto visible = std::min(config_.visible_chars, secret.size() / 2);
        return secret.substr(0, visible) + std::string(secret.size() - visible, config_.mask_char);
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return config_.mask_filenames ? mask_filename(path) : path;
        }

        std::string filename = path.substr(last_sep + 1);
        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }
        return std::string(last_sep, config_.mask_char) + "/" + filename;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
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
        return name.substr(0, config_.visible_chars) +
               std::string(name.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    [[nodiscard]] auto mask_secret_assignments(const std::string& input) const -> std::string {
        static const std::regex secret_pattern(
            R"(((?:secret|token|key|sig|signature|password)[A-Za-z_]*\s*[=:]\s*)([^\s&,;"]+))",
            std::regex::icase);

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), secret_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& m = *it;
            out += input.substr(last_pos, static_cast<size_t>(m.position()) - last_pos);
            out += m[1].str();
            out += mask_secret(m[2].str());
            last_pos = static_cast<size_t>(m.position() + m.length());
        }
        out += input.substr(last_pos);
        return out;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, static_cast<size_t>(it->position()) - last_pos);
            out += mask_path(it->str());
            last_pos = static_cast<size_t>(it->position() + it->length());
        }
        out += input.substr(last_pos);
        return out;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to transfer log lines
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string object;
    std::optional<std::string> direction;
    std::optional<uint64_t> part_number;
    std::optional<uint64_t> total_parts;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<uint32_t> attempt;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto sep = [&] {
            if (!first) oss << ",";
            first = false;
        };
        auto add_string = [&](const char* name, const std::string& value) {
            sep();
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            sep();
            oss << "\"" << name << "\":" << value;
        };

        if (!transfer_id.empty()) add_string("transfer_id", transfer_id);
        if (!object.empty()) {
            add_string("object", masker ? masker->mask_path(object) : object);
        }
        if (direction) add_string("direction", *direction);
        if (part_number) add_uint("part", *part_number);
        if (total_parts) add_uint("total_parts", *total_parts);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (attempt) add_uint("attempt", *attempt);
        if (rate_mbps) {
            sep();
            oss << "\"rate_mbps\":" << std::fixed << std::setprecision(2) << *rate_mbps;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_string("error", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief One formatted log record, delivered to JSON callbacks
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

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << detail::escape_json(masker ? masker->mask(message) : message) << "\"";

        if (context) {
            auto ctx_json = context->to_json(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) oss << ",\"line\":" << *source_line;
            if (function_name) oss << ",\"function\":\"" << *function_name << "\"";
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
    text,
    json
};

/**
 * @brief Logger used by every component of the engine
 *
 * Writes to kcenon logger_system when the build enables it, otherwise to
 * stderr. Callbacks receive every record regardless of the sink.
 */
class transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    transfer_logger() = default;
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call repeatedly; called by the transfer manager constructor.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef RESILIENT_TRANSFER_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#ifdef RESILIENT_TRANSFER_USE_LOGGER_SYSTEM
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
#ifdef RESILIENT_TRANSFER_USE_LOGGER_SYSTEM
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

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the default sink, leaving only callbacks
     */
    void set_console_output(bool enabled) { console_output_.store(enabled); }

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

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        const std::string masked_message = masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked_message, context);
            }
        }

        std::string line_out;
        if (format == log_output_format::json || has_json_callback()) {
            structured_log_entry entry;
            entry.timestamp = iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;

            auto json = entry.to_json(&masker);
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json);
                }
            }
            if (format == log_output_format::json) {
                line_out = std::move(json);
            }
        }

        if (line_out.empty()) {
            std::ostringstream oss;
            oss << local_timestamp() << " [" << log_level_to_string(level) << "] ["
                << category << "] " << masked_message;
            if (context) {
                oss << " " << context->to_json(&masker);
            }
            line_out = oss.str();
        }

        write(level, line_out, file, line, function);
    }

    void flush() {
#ifdef RESILIENT_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    [[nodiscard]] auto has_json_callback() -> bool {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        return static_cast<bool>(json_callback_);
    }

    void write(log_level level, const std::string& text,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
        if (!console_output_.load()) return;
#ifdef RESILIENT_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#else
        (void)level;
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << text << "\n";
    }

#ifdef RESILIENT_TRANSFER_USE_LOGGER_SYSTEM
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

    static auto iso8601_timestamp() -> std::string {
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
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    static auto local_timestamp() -> std::string {
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
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline transfer_logger& get_logger() {
    static transfer_logger instance;
    return instance;
}

#define RT_LOG(level, category, message) \
    kcenon::resilient_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define RT_LOG_CTX(level, category, message, context) \
    kcenon::resilient_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define RT_LOG_TRACE(category, message) \
    RT_LOG(kcenon::resilient_transfer::log_level::trace, category, message)

#define RT_LOG_DEBUG(category, message) \
    RT_LOG(kcenon::resilient_transfer::log_level::debug, category, message)

#define RT_LOG_INFO(category, message) \
    RT_LOG(kcenon::resilient_transfer::log_level::info, category, message)

#define RT_LOG_WARN(category, message) \
    RT_LOG(kcenon::resilient_transfer::log_level::warn, category, message)

#define RT_LOG_ERROR(category, message) \
    RT_LOG(kcenon::resilient_transfer::log_level::error, category, message)

#define RT_LOG_FATAL(category, message) \
    RT_LOG(kcenon::resilient_transfer::log_level::fatal, category, message)

#define RT_LOG_DEBUG_CTX(category, message, ctx) \
    RT_LOG_CTX(kcenon::resilient_transfer::log_level::debug, category, message, ctx)

#define RT_LOG_INFO_CTX(category, message, ctx) \
    RT_LOG_CTX(kcenon::resilient_transfer::log_level::info, category, message, ctx)

#define RT_LOG_WARN_CTX(category, message, ctx) \
    RT_LOG_CTX(kcenon::resilient_transfer::log_level::warn, category, message, ctx)

#define RT_LOG_ERROR_CTX(category, message, ctx) \
    RT_LOG_CTX(kcenon::resilient_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::resilient_transfer
