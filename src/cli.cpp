// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "version.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace http2mqtt {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

CliConfig parse_cli_args(int argc, char* argv[]) {
    CliConfig config;

    CLI::App app{"Simple web server that relays HTTP requests to MQTT messages. " +
                 std::string(SERVICE_NAME) + " v" + SERVICE_VERSION + " (" + GIT_COMMIT + ")"};
    app.set_version_flag("--version", std::string(SERVICE_VERSION));

    app.add_option("-c,--config", config.config_path, "Path to JSON configuration file")
        ->check(CLI::ExistingFile);

    app.add_option("-s,--schema", config.schema_path, "Path to JSON schema for configuration")
        ->check(CLI::ExistingFile);

    std::string log_level;
    auto log_opt =
        app.add_option("-l,--log-level,--log", log_level,
                       "Set logging mode: ERROR, WARN, INFO, DEBUG, TRACE (overrides config)")
            ->check(CLI::IsMember({"error", "warn", "warning", "info", "debug", "trace"},
                                  CLI::ignore_case));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (config.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        std::exit(1);
    }
    if (config.schema_path.empty()) {
        std::cerr << "Error: --schema is required\n";
        std::exit(1);
    }

    if (log_opt->count() > 0) {
        config.log_level = to_lower(log_level);
    }

    return config;
}

} // namespace http2mqtt
