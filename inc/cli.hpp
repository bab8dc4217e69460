// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace http2mqtt {

/**
 * @brief Command-line interface configuration for bootstrap.
 *
 * Contains only bootstrap options needed before config file loading.
 * Service configuration comes from JSON config file (see config_loader.hpp).
 */
struct CliConfig {
    /// Path to JSON config file
    std::filesystem::path config_path;

    /// Path to JSON schema file
    std::filesystem::path schema_path;

    /// Log level override (lower-case), takes priority over config file and environment
    std::optional<std::string> log_level;
};

/**
 * @brief Parse command-line arguments and configure application.
 *
 * Exits the process on --help, --version or invalid arguments.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return CliConfig Parsed configuration
 */
CliConfig parse_cli_args(int argc, char* argv[]);

} // namespace http2mqtt
