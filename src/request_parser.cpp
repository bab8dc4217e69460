// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "request_parser.hpp"

#include <optional>
#include <vector>

namespace http2mqtt {

namespace {

constexpr char PATH_SEPARATOR = '/';

std::optional<int> hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return std::nullopt;
}

/**
 * @brief Split on separator, at most max_parts pieces (last piece keeps the rest).
 */
std::vector<std::string_view> splitLimited(std::string_view input, char separator,
                                           std::size_t max_parts) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;

    while (parts.size() + 1 < max_parts) {
        auto pos = input.find(separator, start);
        if (pos == std::string_view::npos) {
            break;
        }
        parts.push_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(input.substr(start));

    return parts;
}

} // namespace

std::string url_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());

    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            auto high = hexValue(encoded[i + 1]);
            auto low = hexValue(encoded[i + 2]);
            if (high && low) {
                decoded.push_back(static_cast<char>((*high << 4) | *low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(encoded[i]);
    }

    return decoded;
}

ParsedPath parse_path(std::string_view path) {
    auto parts = splitLimited(path, PATH_SEPARATOR, PATH_SEGMENT_COUNT);
    if (parts.size() != PATH_SEGMENT_COUNT) {
        throw MalformedPathError(parts.size());
    }

    // parts[0] is whatever precedes the first '/', empty for origin-form targets
    return ParsedPath{url_decode(parts[1]), url_decode(parts[2])};
}

} // namespace http2mqtt
