// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "sanitizer.hpp"

#include <cctype>

namespace http2mqtt {

namespace {

bool isAllowed(char c, std::string_view extra_allowed) {
    auto uc = static_cast<unsigned char>(c);
    // isalnum is locale dependent, restrict to 7-bit ASCII explicitly
    if (uc < 0x80 && std::isalnum(uc)) {
        return true;
    }
    return extra_allowed.find(c) != std::string_view::npos;
}

} // namespace

std::string sanitize(std::string_view input, std::string_view extra_allowed) {
    std::string result;
    result.reserve(input.size());

    for (char c : input) {
        if (isAllowed(c, extra_allowed)) {
            result.push_back(c);
        }
    }

    return result;
}

} // namespace http2mqtt
