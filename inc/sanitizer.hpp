// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>

namespace http2mqtt {

/// Extra characters allowed in topics: the MQTT level separator.
constexpr std::string_view TOPIC_EXTRA_CHARS = "/";

/// Extra characters allowed in messages: ASCII punctuation and space.
constexpr std::string_view MESSAGE_EXTRA_CHARS = R"(!"#$%&'()*+,-./:;<=>?@[\]^_`{|}~ )";

/**
 * @brief Restrict an untrusted string to an allowlist of characters.
 *
 * ASCII letters and digits are always allowed; @p extra_allowed adds to them.
 * Every other character (including all non-ASCII bytes) is dropped, order of
 * the remaining characters is preserved. The operation cannot fail and is
 * idempotent.
 *
 * @param input Raw (already URL-decoded) string
 * @param extra_allowed Characters allowed in addition to alphanumerics
 * @return Filtered copy of @p input
 */
std::string sanitize(std::string_view input, std::string_view extra_allowed = {});

} // namespace http2mqtt
