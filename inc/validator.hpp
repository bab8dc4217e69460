// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

namespace http2mqtt {

/// Allowed topics (exact match, before the prefix is applied). Empty disables the check.
using TopicWhitelist = std::unordered_set<std::string>;

/**
 * @brief Outcome of request validation, in precedence order.
 */
enum class ValidationResult {
    Ok,
    TopicNotAllowed, ///< Whitelist is non-empty and does not contain the topic
    MessageTooLong   ///< Sanitized message exceeds the configured maximum
};

/**
 * @brief Check a sanitized topic and message against the gateway policy.
 *
 * The topic check short-circuits the length check: a request failing both
 * reports TopicNotAllowed.
 *
 * @param topic Sanitized topic, without prefix
 * @param message Sanitized message
 * @param whitelist Allowed topics, empty to accept any topic
 * @param max_message_length Inclusive upper bound on message length
 */
[[nodiscard]] ValidationResult validate(std::string_view topic, std::string_view message,
                                        const TopicWhitelist& whitelist,
                                        std::size_t max_message_length);

/// Short name for logs ("ok", "topic_not_allowed", "message_too_long").
const char* to_string(ValidationResult result);

} // namespace http2mqtt
