// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "config_loader.hpp"
#include "mqtt_publisher.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace http2mqtt {

/// HTTP status codes produced by the gateway.
namespace status {
constexpr int OK = 200;
constexpr int MALFORMED_PATH = 403;
constexpr int TOPIC_NOT_ALLOWED = 404;
constexpr int MESSAGE_TOO_LONG = 406;
constexpr int PUBLISH_FAILED = 500;
} // namespace status

/// Response messages embedded in the HTML body.
namespace message {
constexpr const char* OK = "OK";
constexpr const char* MALFORMED_PATH = "Invalid request";
constexpr const char* TOPIC_NOT_ALLOWED = "ERROR: Invalid topic";
constexpr const char* MESSAGE_TOO_LONG = "ERROR: Invalid message length";
constexpr const char* PUBLISH_FAILED = "ERROR: MQ failed";
} // namespace message

/// Content type of every gateway response.
constexpr const char* RESPONSE_CONTENT_TYPE = "text/html";

/**
 * @brief HTTP response produced for one gateway request.
 */
struct HttpResponse {
    int status = status::OK;
    std::string body;
};

/**
 * @brief Wrap a response message in the minimal HTML document sent to clients.
 */
std::string render_html(std::string_view message);

/**
 * @brief Translates one HTTP request path into at most one MQTT publish.
 *
 * Pipeline: parse -> sanitize -> validate -> prefix -> publish -> respond.
 * The first failing stage decides the response; later stages are skipped.
 *
 * handle() is reentrant: the configuration is read-only and the only
 * mutable members are statistics counters.
 */
class RequestHandler {
public:
    /**
     * @brief Construct handler.
     *
     * @param config Gateway policy; must outlive the handler
     * @param publisher Publisher used for every accepted request
     */
    RequestHandler(const GatewayConfig& config, std::shared_ptr<IMqttPublisher> publisher);

    /**
     * @brief Process a raw (not percent-decoded) request path.
     *
     * @param path Request target, e.g. "/topic/hello%20world"
     * @return HttpResponse Status code and HTML body
     * @throws std::invalid_argument propagated from the publisher on programmer errors
     */
    [[nodiscard]] HttpResponse handle(std::string_view path);

    [[nodiscard]] std::uint64_t receivedCount() const { return received_count_.load(); }
    [[nodiscard]] std::uint64_t publishedCount() const { return published_count_.load(); }
    [[nodiscard]] std::uint64_t rejectedCount() const { return rejected_count_.load(); }

private:
    HttpResponse reject(std::string_view path, int status_code, const char* response_message,
                        const char* reason);

    const GatewayConfig& config_;
    std::shared_ptr<IMqttPublisher> publisher_;

    std::atomic<std::uint64_t> received_count_{0};
    std::atomic<std::uint64_t> published_count_{0};
    std::atomic<std::uint64_t> rejected_count_{0};
};

} // namespace http2mqtt
