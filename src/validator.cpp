// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "validator.hpp"

namespace http2mqtt {

ValidationResult validate(std::string_view topic, std::string_view message,
                          const TopicWhitelist& whitelist, std::size_t max_message_length) {
    if (!whitelist.empty() && whitelist.find(std::string(topic)) == whitelist.end()) {
        return ValidationResult::TopicNotAllowed;
    }

    if (message.size() > max_message_length) {
        return ValidationResult::MessageTooLong;
    }

    return ValidationResult::Ok;
}

const char* to_string(ValidationResult result) {
    switch (result) {
        case ValidationResult::Ok:
            return "ok";
        case ValidationResult::TopicNotAllowed:
            return "topic_not_allowed";
        case ValidationResult::MessageTooLong:
            return "message_too_long";
    }
    return "unknown";
}

} // namespace http2mqtt
