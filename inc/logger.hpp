// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace http2mqtt {

/// MQTT context attached to a structured log entry.
struct MqttContext {
    std::string topic;
    std::optional<int> qos;
    std::string direction; ///< "publish", "connect", "disconnect"
};

/// HTTP request context attached to a structured log entry.
struct HttpContext {
    std::string method;
    std::string path;
    std::optional<int> status;
};

/// Error context attached to a structured log entry.
struct ErrorContext {
    std::string type;
    std::string message;
};

/**
 * @brief Builder for a single structured log line.
 *
 * Usage:
 *   LOG_INFO_ENTRY(LogEntry("Request rejected")
 *                      .component("request_handler")
 *                      .http({.method = "GET", .path = path, .status = 404}));
 */
class LogEntry {
public:
    explicit LogEntry(std::string msg) : msg_(std::move(msg)) {}

    LogEntry& component(std::string value) {
        component_ = std::move(value);
        return *this;
    }

    LogEntry& operation(std::string value) {
        operation_ = std::move(value);
        return *this;
    }

    LogEntry& mqtt(MqttContext value) {
        mqtt_ = std::move(value);
        return *this;
    }

    LogEntry& http(HttpContext value) {
        http_ = std::move(value);
        return *this;
    }

    LogEntry& error(ErrorContext value) {
        error_ = std::move(value);
        return *this;
    }

    /**
     * @brief Serialize the entry fields as the tail of a JSON object.
     *
     * Produces `"msg":"...","component":"..."` without surrounding braces;
     * timestamp and level are prepended by the sink pattern.
     */
    [[nodiscard]] std::string to_json_fields() const;

private:
    std::string msg_;
    std::optional<std::string> component_;
    std::optional<std::string> operation_;
    std::optional<MqttContext> mqtt_;
    std::optional<HttpContext> http_;
    std::optional<ErrorContext> error_;
};

/**
 * @brief Process-wide JSON-line logger on top of spdlog.
 *
 * Writes one JSON object per line to stderr:
 *   {"timestamp":"2026-01-01T00:00:00.000Z","level":"info","msg":"...",...}
 */
class Logger {
public:
    /**
     * @brief Install the stderr logger as spdlog default.
     *
     * @param level trace|debug|info|warn|warning|error
     */
    static void init(const std::string& level);

    static void shutdown();

    /// Change the active level after init (e.g. CLI override).
    static void set_level(const std::string& level);

    [[nodiscard]] static bool should_log(spdlog::level::level_enum level) {
        return spdlog::default_logger_raw()->should_log(level);
    }

    [[nodiscard]] static bool should_log_debug() { return should_log(spdlog::level::debug); }

    static void log(spdlog::level::level_enum level, const LogEntry& entry);
};

} // namespace http2mqtt

// Format-string logging: LOG_INFO("Published to {} ({} bytes)", topic, size)
#define HTTP2MQTT_LOG_FMT(lvl, ...)                                                             \
    do {                                                                                       \
        if (::http2mqtt::Logger::should_log(lvl)) {                                            \
            ::http2mqtt::Logger::log(lvl, ::http2mqtt::LogEntry(fmt::format(__VA_ARGS__)));    \
        }                                                                                      \
    } while (0)

// Structured logging: LOG_INFO_ENTRY(LogEntry("msg").component("mqtt"))
#define HTTP2MQTT_LOG_ENTRY(lvl, entry)                                                         \
    do {                                                                                       \
        if (::http2mqtt::Logger::should_log(lvl)) {                                            \
            ::http2mqtt::Logger::log(lvl, entry);                                              \
        }                                                                                      \
    } while (0)

#define LOG_TRACE(...) HTTP2MQTT_LOG_FMT(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) HTTP2MQTT_LOG_FMT(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...) HTTP2MQTT_LOG_FMT(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...) HTTP2MQTT_LOG_FMT(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) HTTP2MQTT_LOG_FMT(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) HTTP2MQTT_LOG_FMT(spdlog::level::critical, __VA_ARGS__)

#define LOG_DEBUG_ENTRY(entry) HTTP2MQTT_LOG_ENTRY(spdlog::level::debug, entry)
#define LOG_INFO_ENTRY(entry) HTTP2MQTT_LOG_ENTRY(spdlog::level::info, entry)
#define LOG_WARN_ENTRY(entry) HTTP2MQTT_LOG_ENTRY(spdlog::level::warn, entry)
#define LOG_ERROR_ENTRY(entry) HTTP2MQTT_LOG_ENTRY(spdlog::level::err, entry)
