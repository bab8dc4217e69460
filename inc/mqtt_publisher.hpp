// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "config_loader.hpp"

#include <string>
#include <string_view>

#include <mqtt/connect_options.h>
#include <mqtt/ssl_options.h>

namespace http2mqtt {

/**
 * @brief Outcome of a single publish attempt.
 */
enum class PublishResult {
    Success,
    TransportFailure ///< Connect, authentication, send or disconnect failed
};

/**
 * @brief Interface for one-shot MQTT publishing.
 *
 * Enables dependency injection and mocking for unit tests.
 * Implementations must be safe to call concurrently from several HTTP workers.
 */
class IMqttPublisher {
public:
    virtual ~IMqttPublisher() = default;

    /**
     * @brief Publish one retained message and return once it is handed over or failed.
     *
     * @param topic Full topic (prefix already applied)
     * @param payload Message body
     * @return PublishResult::TransportFailure on any broker or network error
     * @throws std::invalid_argument if topic is empty or contains wildcards
     */
    [[nodiscard]] virtual PublishResult publish(const std::string& topic,
                                                const std::string& payload) = 0;
};

/**
 * @brief Paho-based publisher that opens a fresh connection for every message.
 *
 * Each publish() connects, sends one message with QoS 0 and the retained
 * flag set, then disconnects. No connection state is kept between calls and
 * no retry is attempted.
 */
class MqttPublisher : public IMqttPublisher {
public:
    /// QoS 0 = at-most-once; the broker keeps the last value via the retained flag
    static constexpr int MQTT_QOS = 0;
    static constexpr bool MQTT_RETAINED = true;

    /**
     * @brief Prepare connection options; does not contact the broker.
     *
     * @throws std::runtime_error if configured TLS files do not exist
     */
    explicit MqttPublisher(const MqttConfig& config);

    [[nodiscard]] PublishResult publish(const std::string& topic,
                                        const std::string& payload) override;

    [[nodiscard]] const std::string& clientId() const { return client_id_; }
    [[nodiscard]] const std::string& serverUri() const { return server_uri_; }

    /**
     * @brief Default client ID: http2mqtt-{hostname}-{pid}.
     */
    static std::string generateClientId();

    /**
     * @brief Build the Paho server URI: tcp://host:port or ssl://host:port.
     */
    static std::string buildServerUri(const MqttConfig& config);

    /**
     * @brief Check if a CONNACK return code denotes a permanent failure.
     *
     * Bad protocol version, rejected identifier, bad credentials and not
     * authorized will not succeed on a later request without a config change.
     */
    static bool isPermanentConnectError(int rc);

    /**
     * @brief Reject topics no well-behaved caller produces.
     *
     * @throws std::invalid_argument if topic is empty or contains '+' or '#'
     */
    static void validateTopic(std::string_view topic);

private:
    mqtt::ssl_options buildTlsOptions() const;

    MqttConfig config_;
    std::string server_uri_;
    std::string client_id_;
    mqtt::connect_options conn_opts_;
};

} // namespace http2mqtt
