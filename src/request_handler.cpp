// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "request_handler.hpp"
#include "logger.hpp"
#include "request_parser.hpp"
#include "sanitizer.hpp"
#include "validator.hpp"

namespace http2mqtt {

namespace {

constexpr const char* HTML_HEAD = "<html><head><title>MqResponse</title></head><body>";
constexpr const char* HTML_TAIL = "</body></html>";

} // namespace

std::string render_html(std::string_view message) {
    std::string html = HTML_HEAD;
    html.append(message);
    html.append(HTML_TAIL);
    return html;
}

RequestHandler::RequestHandler(const GatewayConfig& config,
                               std::shared_ptr<IMqttPublisher> publisher)
    : config_(config), publisher_(std::move(publisher)) {
    if (config_.topic_whitelist.empty()) {
        LOG_WARN("Topic whitelist is empty, any topic will be accepted");
    } else {
        LOG_INFO("Topic whitelist enabled with {} topics", config_.topic_whitelist.size());
    }
    LOG_INFO("Topic prefix: '{}', max message length: {}", config_.topic_prefix,
             config_.max_message_length);
}

HttpResponse RequestHandler::handle(std::string_view path) {
    received_count_++;
    LOG_INFO("Handling new HTTP request {}", path);

    ParsedPath parsed;
    try {
        parsed = parse_path(path);
    } catch (const MalformedPathError& e) {
        LOG_INFO("{}", e.what());
        return reject(path, status::MALFORMED_PATH, message::MALFORMED_PATH, "malformed_path");
    }

    std::string topic = sanitize(parsed.topic, TOPIC_EXTRA_CHARS);
    std::string payload = sanitize(parsed.message, MESSAGE_EXTRA_CHARS);
    LOG_INFO("Topic   = {}", topic);
    LOG_INFO("Message = {}", payload);

    switch (validate(topic, payload, config_.topic_whitelist, config_.max_message_length)) {
        case ValidationResult::TopicNotAllowed:
            LOG_INFO("Topic not allowed by topic whitelist.");
            return reject(path, status::TOPIC_NOT_ALLOWED, message::TOPIC_NOT_ALLOWED,
                          to_string(ValidationResult::TopicNotAllowed));
        case ValidationResult::MessageTooLong:
            LOG_INFO("Message exceeds maximum defined message length.");
            return reject(path, status::MESSAGE_TOO_LONG, message::MESSAGE_TOO_LONG,
                          to_string(ValidationResult::MessageTooLong));
        case ValidationResult::Ok:
            break;
    }

    std::string full_topic = config_.topic_prefix + topic;
    LOG_INFO("Start sending MQTT message.");
    if (publisher_->publish(full_topic, payload) != PublishResult::Success) {
        return reject(path, status::PUBLISH_FAILED, message::PUBLISH_FAILED, "transport_error");
    }

    published_count_++;
    LOG_INFO_ENTRY(LogEntry("Sending HTTP response")
                       .component("request_handler")
                       .mqtt({.topic = full_topic, .direction = "publish"})
                       .http({.method = "GET", .path = std::string(path), .status = status::OK}));
    return HttpResponse{status::OK, render_html(message::OK)};
}

HttpResponse RequestHandler::reject(std::string_view path, int status_code,
                                    const char* response_message, const char* reason) {
    rejected_count_++;
    LOG_INFO_ENTRY(LogEntry("Sending HTTP response")
                       .component("request_handler")
                       .http({.method = "GET", .path = std::string(path), .status = status_code})
                       .error({.type = reason, .message = response_message}));
    return HttpResponse{status_code, render_html(response_message)};
}

} // namespace http2mqtt
