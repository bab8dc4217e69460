// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "config_loader.hpp"
#include "request_handler.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace httplib {
class Server;
}

namespace http2mqtt {

/**
 * @brief HTTP front end of the gateway.
 *
 * Every GET request, whatever its path, is passed to the RequestHandler with
 * the raw request target. Requests are served on the cpp-httplib worker pool.
 */
class HttpServer {
public:
    /**
     * @brief Construct server (does not bind yet).
     *
     * @param config Listener host and port; port 0 picks an ephemeral port
     * @param handler Request handler; must outlive the server
     */
    HttpServer(const HttpConfig& config, RequestHandler& handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind the listener and start serving in a background thread.
     *
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /**
     * @brief Stop accepting requests and join the listener thread.
     */
    void stop();

    /// Port actually bound; valid after start().
    [[nodiscard]] int port() const { return bound_port_.load(); }

    [[nodiscard]] bool isRunning() const { return thread_.joinable(); }

private:
    void server_thread();

    const HttpConfig& config_;
    RequestHandler& handler_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<int> bound_port_{0};
};

} // namespace http2mqtt
