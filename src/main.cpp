// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "cli.hpp"
#include "config_loader.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "mqtt_publisher.hpp"
#include "request_handler.hpp"

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}
} // namespace

int main(int argc, char* argv[]) {
    // Parse command-line arguments (bootstrap only)
    auto cli_config = http2mqtt::parse_cli_args(argc, argv);

    // Load and validate service configuration from JSON file
    http2mqtt::ServiceConfig config;
    try {
        config = http2mqtt::load_config(cli_config.config_path, cli_config.schema_path);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    if (cli_config.log_level.has_value()) {
        config.log_level = cli_config.log_level.value();
    }

    // Configuration is frozen from here on and only handed out by const reference
    const http2mqtt::ServiceConfig& service_config = config;

    http2mqtt::Logger::init(service_config.log_level);

    // Setup signal handlers for graceful shutdown
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    LOG_INFO("HTTP to MQTT gateway starting");

    std::shared_ptr<http2mqtt::MqttPublisher> publisher;
    try {
        publisher = std::make_shared<http2mqtt::MqttPublisher>(service_config.mqtt);
    } catch (const std::exception& e) {
        LOG_CRITICAL("MQTT publisher setup failed: {}", e.what());
        http2mqtt::Logger::shutdown();
        return 1;
    }

    http2mqtt::RequestHandler handler(service_config.gateway, publisher);
    http2mqtt::HttpServer server(service_config.http, handler);

    try {
        server.start();
    } catch (const std::exception& e) {
        LOG_CRITICAL("{}", e.what());
        http2mqtt::Logger::shutdown();
        return 1;
    }

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_WARN("Server stop request.");
    server.stop();

    LOG_WARN("Server stopped. received: {}, published: {}, rejected: {}", handler.receivedCount(),
             handler.publishedCount(), handler.rejectedCount());

    http2mqtt::Logger::shutdown();
    return 0;
}
