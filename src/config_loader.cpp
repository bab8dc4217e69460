// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"
#include "json_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <vector>

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/pointer.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

namespace http2mqtt {

namespace {

constexpr char TLS_CA_CERT[] = "/infrastructure/mqtt/tls/ca_cert_path";
constexpr char TLS_CLIENT_CERT[] = "/infrastructure/mqtt/tls/client_cert_path";
constexpr char TLS_CLIENT_KEY[] = "/infrastructure/mqtt/tls/client_key_path";
constexpr char TLS_VERIFY_SERVER[] = "/infrastructure/mqtt/tls/verify_server";

/**
 * @brief Load and parse JSON schema from file.
 */
rapidjson::SchemaDocument load_schema(const std::filesystem::path& schema_path) {
    std::ifstream ifs(schema_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open schema file: " + schema_path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document schema_doc;
    schema_doc.ParseStream(isw);

    if (schema_doc.HasParseError()) {
        throw std::runtime_error("Failed to parse JSON schema: " + schema_path.string() +
                                 " at offset " + std::to_string(schema_doc.GetErrorOffset()));
    }

    return rapidjson::SchemaDocument(schema_doc);
}

/**
 * @brief Validate JSON document against schema.
 */
void validate_against_schema(const rapidjson::Document& doc,
                             const rapidjson::SchemaDocument& schema,
                             const std::filesystem::path& config_path) {
    rapidjson::SchemaValidator validator(schema);
    if (!doc.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        throw std::runtime_error("Config validation failed for " + config_path.string() +
                                 " at: " + sb.GetString() +
                                 ", keyword: " + validator.GetInvalidSchemaKeyword());
    }
}

/**
 * @brief Get optional environment variable value.
 */
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/**
 * @brief Parse and validate log level from string.
 * @throws std::runtime_error if invalid log level
 */
std::string parse_log_level(const std::string& level, const std::string& source) {
    if (level == "trace" || level == "debug" || level == "info" || level == "warn" ||
        level == "warning" || level == "error") {
        return level;
    }
    throw std::runtime_error("Invalid " + source + ": " + level +
                             " (must be trace|debug|info|warn|warning|error)");
}

/**
 * @brief Parse and validate port number from string.
 * @throws std::runtime_error if invalid or out of range
 */
int parse_port(const std::string& port_str, const std::string& source) {
    try {
        std::size_t consumed = 0;
        int port = std::stoi(port_str, &consumed);
        if (consumed != port_str.size()) {
            throw std::runtime_error("Invalid " + source + ": " + port_str);
        }
        if (port < 1024 || port > 65535) {
            throw std::runtime_error(source + " out of range: " + port_str +
                                     " (must be 1024-65535)");
        }
        return port;
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid " + source + ": " + port_str);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(source + " out of range: " + port_str);
    }
}

/**
 * @brief Parse non-empty hostname from string.
 * @throws std::runtime_error if empty
 */
std::string parse_host(const std::string& host, const std::string& source) {
    if (host.empty()) {
        throw std::runtime_error("Invalid " + source + ": must not be empty");
    }
    return host;
}

/**
 * @brief Extract TLS settings; ca_cert_path is mandatory once TLS is enabled.
 */
std::optional<TlsConfig> load_tls(const rapidjson::Document& doc, bool insecure) {
    if (rapidjson::Pointer(json::MQTT_TLS).Get(doc) == nullptr) {
        if (!insecure) {
            throw std::runtime_error("mqtt.insecure is false but no mqtt.tls section is set");
        }
        return std::nullopt;
    }

    TlsConfig tls;
    tls.ca_cert_path = detail::require_value<std::string>(doc, TLS_CA_CERT, "mqtt.tls");
    tls.client_cert_path = detail::get_value<std::string>(doc, TLS_CLIENT_CERT).value_or("");
    tls.client_key_path = detail::get_value<std::string>(doc, TLS_CLIENT_KEY).value_or("");
    tls.verify_server = detail::get_value<bool>(doc, TLS_VERIFY_SERVER).value_or(true);
    return tls;
}

} // namespace

ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path) {
    // Load and parse config file
    std::ifstream config_ifs(config_path);
    if (!config_ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + config_path.string());
    }

    rapidjson::IStreamWrapper config_isw(config_ifs);
    rapidjson::Document config_doc;
    config_doc.ParseStream(config_isw);

    if (config_doc.HasParseError()) {
        throw std::runtime_error("Failed to parse config JSON: " + config_path.string() +
                                 " at offset " + std::to_string(config_doc.GetErrorOffset()));
    }

    // Load schema and validate
    auto schema = load_schema(schema_path);
    validate_against_schema(config_doc, schema, config_path);

    // Extract values from JSON with defaults using JSON Pointers (RFC6901)
    ServiceConfig config;
    config.log_level =
        GetValueByPointerWithDefault(config_doc, json::LOG_LEVEL, "error").GetString();

    config.http.host =
        GetValueByPointerWithDefault(config_doc, json::HTTP_HOST, "0.0.0.0").GetString();
    config.http.port = GetValueByPointerWithDefault(config_doc, json::HTTP_PORT, 8234).GetInt();

    config.mqtt.host =
        GetValueByPointerWithDefault(config_doc, json::MQTT_HOST, "127.0.0.1").GetString();
    config.mqtt.port = GetValueByPointerWithDefault(config_doc, json::MQTT_PORT, 1883).GetInt();
    config.mqtt.insecure =
        GetValueByPointerWithDefault(config_doc, json::MQTT_INSECURE, true).GetBool();
    config.mqtt.client_id =
        detail::get_value<std::string>(config_doc, json::MQTT_CLIENT_ID).value_or("");
    config.mqtt.username =
        detail::get_value<std::string>(config_doc, json::MQTT_USERNAME).value_or("");
    config.mqtt.password =
        detail::get_value<std::string>(config_doc, json::MQTT_PASSWORD).value_or("");
    config.mqtt.tls = load_tls(config_doc, config.mqtt.insecure);

    auto whitelist = detail::get_value<std::vector<std::string>>(config_doc, json::TOPIC_WHITELIST)
                         .value_or(std::vector<std::string>{});
    config.gateway.topic_whitelist = TopicWhitelist(whitelist.begin(), whitelist.end());
    config.gateway.topic_prefix =
        detail::get_value<std::string>(config_doc, json::TOPIC_PREFIX).value_or("");
    config.gateway.max_message_length = static_cast<std::size_t>(
        GetValueByPointerWithDefault(config_doc, json::MAX_MESSAGE_LENGTH, 100).GetUint64());

    // Apply environment variable overrides
    if (auto env_log_level = get_env(http2mqtt::env::LOG_LEVEL); env_log_level.has_value()) {
        config.log_level = parse_log_level(env_log_level.value(), http2mqtt::env::LOG_LEVEL);
    }

    if (auto env_port = get_env(http2mqtt::env::HTTP_PORT); env_port.has_value()) {
        config.http.port = parse_port(env_port.value(), http2mqtt::env::HTTP_PORT);
    }

    if (auto env_host = get_env(http2mqtt::env::MQTT_HOST); env_host.has_value()) {
        config.mqtt.host = parse_host(env_host.value(), http2mqtt::env::MQTT_HOST);
    }

    if (auto env_user = get_env(http2mqtt::env::MQTT_USER); env_user.has_value()) {
        config.mqtt.username = env_user.value();
    }

    if (auto env_pass = get_env(http2mqtt::env::MQTT_PASS); env_pass.has_value()) {
        config.mqtt.password = env_pass.value();
    }

    return config;
}

} // namespace http2mqtt
