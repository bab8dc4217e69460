// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "validator.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace http2mqtt {

/**
 * @brief TLS settings for the broker connection (used when insecure = false).
 */
struct TlsConfig {
    std::string ca_cert_path;
    std::string client_cert_path;
    std::string client_key_path;
    bool verify_server = true;
};

/**
 * @brief MQTT broker connection settings.
 */
struct MqttConfig {
    std::string host = "127.0.0.1";
    int port = 1883;
    bool insecure = true; ///< tcp:// when true, ssl:// otherwise
    std::optional<TlsConfig> tls;

    /// Client identifier, generated from hostname and pid when empty
    std::string client_id;

    std::string username;
    std::string password;

    /// Credentials are only sent when both username and password are set.
    [[nodiscard]] bool has_credentials() const { return !username.empty() && !password.empty(); }
};

/**
 * @brief HTTP listener settings.
 */
struct HttpConfig {
    std::string host = "0.0.0.0";
    int port = 8234;
};

/**
 * @brief Request policy applied before publishing.
 */
struct GatewayConfig {
    TopicWhitelist topic_whitelist;     ///< Empty disables topic validation
    std::string topic_prefix;           ///< Prepended to the validated topic
    std::size_t max_message_length = 100;
};

/**
 * @brief Service configuration loaded from JSON config file.
 *
 * Immutable after load_config() returns; shared by const reference.
 */
struct ServiceConfig {
    std::string log_level;
    HttpConfig http;
    MqttConfig mqtt;
    GatewayConfig gateway;
};

/// JSON Pointer paths (RFC6901) for extracting ServiceConfig values
namespace json {
constexpr char LOG_LEVEL[] = "/observability/logging/level";
constexpr char HTTP_HOST[] = "/infrastructure/http/host";
constexpr char HTTP_PORT[] = "/infrastructure/http/port";
constexpr char MQTT_HOST[] = "/infrastructure/mqtt/host";
constexpr char MQTT_PORT[] = "/infrastructure/mqtt/port";
constexpr char MQTT_INSECURE[] = "/infrastructure/mqtt/insecure";
constexpr char MQTT_CLIENT_ID[] = "/infrastructure/mqtt/client_id";
constexpr char MQTT_USERNAME[] = "/infrastructure/mqtt/username";
constexpr char MQTT_PASSWORD[] = "/infrastructure/mqtt/password";
constexpr char MQTT_TLS[] = "/infrastructure/mqtt/tls";
constexpr char TOPIC_WHITELIST[] = "/gateway/topic_whitelist";
constexpr char TOPIC_PREFIX[] = "/gateway/topic_prefix";
constexpr char MAX_MESSAGE_LENGTH[] = "/gateway/max_message_length";
} // namespace json

/**
 * @brief Load and validate service configuration from JSON file.
 *
 * Configuration layering (priority: high to low):
 * 1. Environment variables (HTTP2MQTT_LOG_LEVEL, HTTP2MQTT_HTTP_PORT,
 *    MQTT_HOST, MQTT_USER, MQTT_PASS)
 * 2. JSON configuration file
 *
 * @param config_path Path to the JSON configuration file
 * @param schema_path Path to the JSON schema file
 * @return ServiceConfig Validated configuration
 *
 * @throws std::runtime_error if config file not found, invalid JSON, or schema validation fails
 */
ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path);

} // namespace http2mqtt
