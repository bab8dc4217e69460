// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "mqtt_publisher.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <unistd.h>

#include <mqtt/client.h>

namespace http2mqtt {

namespace {

constexpr size_t HOSTNAME_BUFFER_SIZE = 256;
constexpr int KEEPALIVE_SECONDS = 60;
constexpr int CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DISCONNECT_TIMEOUT_MS = 500;

std::string getHostname() {
    char hostname[HOSTNAME_BUFFER_SIZE];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[HOSTNAME_BUFFER_SIZE - 1] = '\0';
        return std::string(hostname);
    }
    return "unknown";
}

/**
 * @brief Clear proxy environment variables if they are set but empty.
 *
 * Paho reads http_proxy/https_proxy/no_proxy and treats an empty value as a
 * proxy URL, which makes every connect fail. Containers commonly export them
 * empty to mask host values. Real proxy URLs are left untouched.
 *
 * Must run before worker threads start: unsetenv is not thread-safe.
 */
void clearEmptyProxyEnvVars() {
    const char* proxy_vars[] = {"http_proxy",  "HTTP_PROXY", "https_proxy",
                                "HTTPS_PROXY", "no_proxy",   "NO_PROXY"};

    bool cleared_any = false;
    for (const char* var : proxy_vars) {
        const char* value = std::getenv(var);
        if (value != nullptr && value[0] == '\0') {
            unsetenv(var);
            cleared_any = true;
        }
    }

    if (cleared_any) {
        LOG_DEBUG("Cleared empty proxy environment variables");
    }
}

} // namespace

std::string MqttPublisher::generateClientId() {
    return "http2mqtt-" + getHostname() + "-" + std::to_string(getpid());
}

std::string MqttPublisher::buildServerUri(const MqttConfig& config) {
    const char* scheme = config.insecure ? "tcp://" : "ssl://";
    return scheme + config.host + ":" + std::to_string(config.port);
}

bool MqttPublisher::isPermanentConnectError(int rc) {
    // MQTT v3.1.1 CONNACK return codes that indicate permanent failures
    switch (rc) {
        case 1: // Unacceptable protocol version
        case 2: // Identifier rejected
        case 4: // Bad user name or password
        case 5: // Not authorized
            return true;
        default:
            return false; // 3=server unavailable, negatives=transient
    }
}

void MqttPublisher::validateTopic(std::string_view topic) {
    if (topic.empty()) {
        throw std::invalid_argument("MQTT publish topic must not be empty");
    }
    if (topic.find_first_of("+#") != std::string_view::npos) {
        throw std::invalid_argument("MQTT publish topic must not contain wildcards: " +
                                    std::string(topic));
    }
}

MqttPublisher::MqttPublisher(const MqttConfig& config)
    : config_(config), server_uri_(buildServerUri(config)),
      client_id_(config.client_id.empty() ? generateClientId() : config.client_id) {
    clearEmptyProxyEnvVars();

    LOG_INFO("MQTT publisher initializing: {} (client_id: {}, auth: {})", server_uri_, client_id_,
             config_.has_credentials() ? "yes" : "no");

    // No automatic reconnect: every publish opens and closes its own session
    auto conn_opts_builder = mqtt::connect_options_builder()
                                 .clean_session(true)
                                 .keep_alive_interval(std::chrono::seconds(KEEPALIVE_SECONDS))
                                 .connect_timeout(std::chrono::seconds(CONNECT_TIMEOUT_SECONDS));

    if (config_.has_credentials()) {
        conn_opts_builder.user_name(config_.username);
        conn_opts_builder.password(config_.password);
    }

    if (!config_.insecure) {
        conn_opts_builder.ssl(buildTlsOptions());
    }

    conn_opts_ = conn_opts_builder.finalize();
}

mqtt::ssl_options MqttPublisher::buildTlsOptions() const {
    auto ssl_opts_builder = mqtt::ssl_options_builder();

    if (config_.tls.has_value()) {
        const auto& tls = config_.tls.value();

        LOG_DEBUG("TLS config: ca_cert='{}', client_cert='{}', client_key='{}', verify={}",
                  tls.ca_cert_path, tls.client_cert_path, tls.client_key_path, tls.verify_server);

        if (!tls.ca_cert_path.empty()) {
            if (!std::filesystem::exists(tls.ca_cert_path)) {
                LOG_ERROR("TLS CA certificate file not found: {}", tls.ca_cert_path);
                throw std::runtime_error("TLS CA certificate file not found: " + tls.ca_cert_path);
            }
            ssl_opts_builder.trust_store(tls.ca_cert_path);
        }

        if (!tls.client_cert_path.empty() && !tls.client_key_path.empty()) {
            if (!std::filesystem::exists(tls.client_cert_path)) {
                LOG_ERROR("TLS client certificate file not found: {}", tls.client_cert_path);
                throw std::runtime_error("TLS client certificate file not found: " +
                                         tls.client_cert_path);
            }
            if (!std::filesystem::exists(tls.client_key_path)) {
                LOG_ERROR("TLS client key file not found: {}", tls.client_key_path);
                throw std::runtime_error("TLS client key file not found: " + tls.client_key_path);
            }
            ssl_opts_builder.key_store(tls.client_cert_path);
            ssl_opts_builder.private_key(tls.client_key_path);
        }

        ssl_opts_builder.enable_server_cert_auth(tls.verify_server);
    } else {
        LOG_DEBUG("TLS config not set, using default SSL options");
    }

    return ssl_opts_builder.finalize();
}

PublishResult MqttPublisher::publish(const std::string& topic, const std::string& payload) {
    validateTopic(topic);

    LOG_INFO("Sending MQTT message to broker {}:{} with clientid {} to topic {}", config_.host,
             config_.port, client_id_, topic);

    // One client per call keeps concurrent requests independent of each other
    std::unique_ptr<mqtt::client> client;

    try {
        client = std::make_unique<mqtt::client>(server_uri_, client_id_);
        client->connect(conn_opts_);
        client->publish(mqtt::make_message(topic, payload, MQTT_QOS, MQTT_RETAINED));
        client->disconnect(std::chrono::milliseconds(DISCONNECT_TIMEOUT_MS));
    } catch (const mqtt::exception& e) {
        int rc = e.get_return_code();
        LOG_ERROR_ENTRY(LogEntry("Failed to connect and/or send MQTT message")
                            .component("mqtt")
                            .mqtt({.topic = topic, .qos = MQTT_QOS, .direction = "publish"})
                            .error({.type = isPermanentConnectError(rc) ? "auth_or_protocol"
                                                                        : "transport",
                                    .message = std::string(e.what()) + " (rc=" +
                                               std::to_string(rc) + ")"}));

        try {
            if (client && client->is_connected()) {
                client->disconnect(std::chrono::milliseconds(DISCONNECT_TIMEOUT_MS));
            }
        } catch (const mqtt::exception& disconnect_error) {
            LOG_WARN("MQTT disconnect after failure: {}", disconnect_error.what());
        }
        return PublishResult::TransportFailure;
    }

    LOG_DEBUG_ENTRY(LogEntry("MQTT message published")
                        .component("mqtt")
                        .mqtt({.topic = topic, .qos = MQTT_QOS, .direction = "publish"}));
    return PublishResult::Success;
}

} // namespace http2mqtt
