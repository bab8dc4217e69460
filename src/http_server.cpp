// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "http_server.hpp"
#include "logger.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include <httplib.h>

namespace http2mqtt {

namespace {

// Catch-all route: the request handler does its own path parsing
constexpr const char* ROUTE_ANY_PATH = ".*";

constexpr const char* INTERNAL_ERROR_MESSAGE = "ERROR: Internal error";

} // namespace

HttpServer::HttpServer(const HttpConfig& config, RequestHandler& handler)
    : config_(config), handler_(handler) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (thread_.joinable()) {
        LOG_WARN("HTTP server already running");
        return;
    }

    server_ = std::make_unique<httplib::Server>();

    // req.target is the raw request target; req.path is already percent-decoded
    // and would turn "%2F" into a separator before the handler sees it
    server_->Get(ROUTE_ANY_PATH, [this](const httplib::Request& req, httplib::Response& res) {
        auto response = handler_.handle(req.target);
        res.status = response.status;
        res.set_content(response.body, RESPONSE_CONTENT_TYPE);
    });

    // Programmer errors escaping the handler are not transport failures: log loudly
    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                LOG_CRITICAL("Unhandled error while serving {}: {}", req.target, e.what());
            } catch (...) {
                LOG_CRITICAL("Unhandled non-standard error while serving {}", req.target);
            }
            res.status = 500;
            res.set_content(render_html(INTERNAL_ERROR_MESSAGE), RESPONSE_CONTENT_TYPE);
        });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOG_DEBUG_ENTRY(LogEntry("HTTP request served")
                            .component("http")
                            .http({.method = req.method,
                                   .path = req.target,
                                   .status = res.status}));
    });

    int port = config_.port;
    if (port == 0) {
        port = server_->bind_to_any_port(config_.host);
        if (port < 0) {
            port = 0;
        }
    } else if (!server_->bind_to_port(config_.host, port)) {
        port = 0;
    }

    if (port == 0) {
        LOG_ERROR_ENTRY(LogEntry("Failed to start HTTP server")
                            .component("http")
                            .operation(config_.host + ":" + std::to_string(config_.port)));
        server_.reset();
        throw std::runtime_error("Failed to bind HTTP server to " + config_.host + ":" +
                                 std::to_string(config_.port));
    }

    bound_port_ = port;
    LOG_INFO("Starting HTTP server on http://{}:{}...", config_.host, port);
    thread_ = std::thread(&HttpServer::server_thread, this);

    // stop() is a no-op on a server that has not entered its accept loop yet
    server_->wait_until_ready();
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    server_.reset();
}

void HttpServer::server_thread() {
    LOG_INFO_ENTRY(LogEntry("Server started.").component("http"));

    // Blocks until stop()
    if (!server_->listen_after_bind()) {
        LOG_ERROR_ENTRY(LogEntry("HTTP server listen loop failed").component("http"));
    }

    LOG_INFO_ENTRY(LogEntry("Server stopped.").component("http"));
}

} // namespace http2mqtt
