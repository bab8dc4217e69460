// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <vector>

namespace http2mqtt {
namespace {

/**
 * @brief Helper to convert string vector to argc/argv format.
 */
class ArgvHelper {
public:
    ArgvHelper(const std::vector<std::string>& args) {
        for (const auto& arg : args) {
            args_.push_back(arg);
        }
        argv_.reserve(args_.size());
        for (auto& arg : args_) {
            argv_.push_back(&arg[0]);
        }
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> argv_;
};

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content = "{}") {
        path_ = std::filesystem::temp_directory_path() /
                ("http2mqtt_cli_test_" + std::to_string(counter_++) + ".json");
        std::ofstream ofs(path_);
        ofs << content;
    }

    ~TempFile() { std::filesystem::remove(path_); }

    std::string path_str() const { return path_.string(); }

private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

//
// Bootstrap file options
//

/**
 * @brief Test valid config and schema files.
 */
TEST(CliTest, ConfigAndSchema) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper(
        {"http2mqtt", "--config", config_file.path_str(), "--schema", schema_file.path_str()});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.config_path, config_file.path_str());
    EXPECT_EQ(config.schema_path, schema_file.path_str());
    EXPECT_FALSE(config.log_level.has_value());
}

/**
 * @brief Test short options.
 */
TEST(CliTest, ShortOptions) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper({"http2mqtt", "-c", config_file.path_str(), "-s", schema_file.path_str()});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.config_path, config_file.path_str());
    EXPECT_EQ(config.schema_path, schema_file.path_str());
}

/**
 * @brief Test missing config file option exits with error.
 */
TEST(CliTest, WithoutConfigExits) {
    TempFile schema_file;
    ArgvHelper helper({"http2mqtt", "--schema", schema_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

/**
 * @brief Test missing schema file option exits with error.
 */
TEST(CliTest, WithoutSchemaExits) {
    TempFile config_file;
    ArgvHelper helper({"http2mqtt", "--config", config_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

/**
 * @brief Test without any args exits with error.
 */
TEST(CliTest, WithoutArgsExits) {
    ArgvHelper helper({"http2mqtt"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

/**
 * @brief Test non-existent config file exits with validation error.
 */
TEST(CliTest, NonExistentConfigExits) {
    TempFile schema_file;
    ArgvHelper helper(
        {"http2mqtt", "--config", "/nonexistent/config.json", "--schema", schema_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(105), "");
}

//
// Log level override
//

/**
 * @brief Test log level is accepted case-insensitively and normalized.
 */
TEST(CliTest, LogLevelIsCaseInsensitive) {
    TempFile config_file;
    TempFile schema_file;

    for (const auto& [given, expected] : std::vector<std::pair<std::string, std::string>>{
             {"ERROR", "error"},
             {"Warn", "warn"},
             {"WARNING", "warning"},
             {"info", "info"},
             {"DEBUG", "debug"}}) {
        ArgvHelper helper({"http2mqtt", "-c", config_file.path_str(), "-s",
                           schema_file.path_str(), "--log-level", given});
        auto config = parse_cli_args(helper.argc(), helper.argv());
        ASSERT_TRUE(config.log_level.has_value());
        EXPECT_EQ(config.log_level.value(), expected);
    }
}

/**
 * @brief Test --log alias for the log level option.
 */
TEST(CliTest, LogAlias) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper({"http2mqtt", "-c", config_file.path_str(), "-s", schema_file.path_str(),
                       "--log", "INFO"});
    auto config = parse_cli_args(helper.argc(), helper.argv());
    EXPECT_EQ(config.log_level.value_or(""), "info");
}

/**
 * @brief Test unknown log level exits with validation error.
 */
TEST(CliTest, InvalidLogLevelExits) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper({"http2mqtt", "-c", config_file.path_str(), "-s", schema_file.path_str(),
                       "-l", "verbose"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(105), "");
}

//
// General CLI tests
//

/**
 * @brief Test help flag exits gracefully.
 */
TEST(CliTest, HelpFlag) {
    ArgvHelper helper({"http2mqtt", "--help"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(0), "");
}

/**
 * @brief Test version flag exits gracefully.
 */
TEST(CliTest, VersionFlag) {
    ArgvHelper helper({"http2mqtt", "--version"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(0), "");
}

/**
 * @brief Test invalid option exits with error.
 */
TEST(CliTest, InvalidOption) {
    ArgvHelper helper({"http2mqtt", "--invalid-option"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(109), "");
}

} // namespace
} // namespace http2mqtt
