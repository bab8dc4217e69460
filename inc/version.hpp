// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Service version metadata (compile-time constants)
//
// All values are injected by CMake via compile definitions:
//   - HTTP2MQTT_SERVICE_NAME
//   - HTTP2MQTT_SERVICE_VERSION
//   - HTTP2MQTT_GIT_COMMIT
//
// Fallback defaults are provided for IDE/local development without CMake.
// -----------------------------------------------------------------------------

#ifndef HTTP2MQTT_SERVICE_NAME
    #define HTTP2MQTT_SERVICE_NAME "http2mqtt"
#endif

#ifndef HTTP2MQTT_SERVICE_VERSION
    #define HTTP2MQTT_SERVICE_VERSION "dev"
#endif

#ifndef HTTP2MQTT_GIT_COMMIT
    #define HTTP2MQTT_GIT_COMMIT "unknown"
#endif

namespace http2mqtt {

constexpr const char* SERVICE_NAME = HTTP2MQTT_SERVICE_NAME;
constexpr const char* SERVICE_VERSION = HTTP2MQTT_SERVICE_VERSION;
constexpr const char* GIT_COMMIT = HTTP2MQTT_GIT_COMMIT;

} // namespace http2mqtt
