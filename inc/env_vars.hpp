// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Environment variable names for runtime configuration overrides.
//
// Broker address and credentials keep the unprefixed MQTT_* names so that
// existing deployments exporting MQTT_HOST/MQTT_USER/MQTT_PASS keep working.
// Credentials should be supplied this way rather than stored in the config file.
// -----------------------------------------------------------------------------

namespace http2mqtt::env {

/// Environment variable for overriding log level (trace/debug/info/warn/error)
constexpr const char* LOG_LEVEL = "HTTP2MQTT_LOG_LEVEL";

/// Environment variable for overriding HTTP listener port (1024-65535)
constexpr const char* HTTP_PORT = "HTTP2MQTT_HTTP_PORT";

/// MQTT broker hostname or IP address
constexpr const char* MQTT_HOST = "MQTT_HOST";

/// MQTT username, only used together with MQTT_PASS
constexpr const char* MQTT_USER = "MQTT_USER";

/// MQTT password, only used together with MQTT_USER
constexpr const char* MQTT_PASS = "MQTT_PASS";

} // namespace http2mqtt::env
