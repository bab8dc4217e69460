// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace http2mqtt {

/// Number of segments a request path must split into: prefix, topic, message.
constexpr std::size_t PATH_SEGMENT_COUNT = 3;

/**
 * @brief Exception thrown when a request path is not of the form /<topic>/<message>.
 */
class MalformedPathError : public std::runtime_error {
public:
    explicit MalformedPathError(std::size_t part_count)
        : std::runtime_error("Unexpected request format; path length should be " +
                             std::to_string(PATH_SEGMENT_COUNT) + " but is " +
                             std::to_string(part_count)),
          part_count_(part_count) {}

    /// Number of segments the path actually split into.
    [[nodiscard]] std::size_t part_count() const { return part_count_; }

private:
    std::size_t part_count_;
};

/**
 * @brief Raw topic and message extracted from a request path.
 *
 * Both values are URL-decoded but not yet sanitized.
 */
struct ParsedPath {
    std::string topic;
    std::string message;
};

/**
 * @brief Percent-decode a URL component.
 *
 * "%XX" with two hex digits becomes the corresponding byte. A '%' that is
 * not followed by two hex digits is kept as-is. '+' is not translated to a
 * space (path semantics, not form encoding).
 */
std::string url_decode(std::string_view encoded);

/**
 * @brief Split a raw request path into topic and message.
 *
 * Only the first two '/' are treated as separators, so the message may
 * contain further '/'. Segments are decoded after splitting, which lets
 * clients carry a literal '/' inside the topic as "%2F".
 *
 * @param path Raw request target, e.g. "/topic/hello%20world"
 * @return ParsedPath Decoded topic and message
 * @throws MalformedPathError if the path does not split into exactly 3 segments
 */
ParsedPath parse_path(std::string_view path);

} // namespace http2mqtt
