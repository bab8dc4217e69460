// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include "version.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace http2mqtt {

namespace {

// Timestamp and level come from the sink; the entry supplies the rest of the object
constexpr const char* JSON_LINE_PATTERN =
    R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l",%v})";

spdlog::level::level_enum to_spdlog_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

} // namespace

std::string LogEntry::to_json_fields() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("msg");
    writer.String(msg_.c_str(), static_cast<rapidjson::SizeType>(msg_.size()));

    if (component_) {
        writer.Key("component");
        writer.String(component_->c_str());
    }
    if (operation_) {
        writer.Key("operation");
        writer.String(operation_->c_str());
    }
    if (mqtt_) {
        writer.Key("mqtt");
        writer.StartObject();
        writer.Key("topic");
        writer.String(mqtt_->topic.c_str(), static_cast<rapidjson::SizeType>(mqtt_->topic.size()));
        if (mqtt_->qos) {
            writer.Key("qos");
            writer.Int(*mqtt_->qos);
        }
        if (!mqtt_->direction.empty()) {
            writer.Key("direction");
            writer.String(mqtt_->direction.c_str());
        }
        writer.EndObject();
    }
    if (http_) {
        writer.Key("http");
        writer.StartObject();
        writer.Key("method");
        writer.String(http_->method.c_str());
        writer.Key("path");
        writer.String(http_->path.c_str(), static_cast<rapidjson::SizeType>(http_->path.size()));
        if (http_->status) {
            writer.Key("status");
            writer.Int(*http_->status);
        }
        writer.EndObject();
    }
    if (error_) {
        writer.Key("error");
        writer.StartObject();
        writer.Key("type");
        writer.String(error_->type.c_str());
        writer.Key("message");
        writer.String(error_->message.c_str());
        writer.EndObject();
    }
    writer.EndObject();

    // Strip the enclosing braces, the sink pattern supplies them
    std::string json = buffer.GetString();
    return json.substr(1, json.size() - 2);
}

void Logger::init(const std::string& level) {
    spdlog::drop(SERVICE_NAME);
    auto logger = spdlog::stderr_logger_mt(SERVICE_NAME);
    logger->set_pattern(JSON_LINE_PATTERN, spdlog::pattern_time_type::utc);
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void Logger::set_level(const std::string& level) {
    spdlog::default_logger_raw()->set_level(to_spdlog_level(level));
}

void Logger::shutdown() {
    spdlog::default_logger_raw()->flush();
    spdlog::shutdown();
}

void Logger::log(spdlog::level::level_enum level, const LogEntry& entry) {
    spdlog::default_logger_raw()->log(level, "{}", entry.to_json_fields());
}

} // namespace http2mqtt
