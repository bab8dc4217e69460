// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <optional>
#include <vector>

namespace http2mqtt {
namespace {

/**
 * @brief RAII helper for setting/unsetting environment variables.
 *
 * A null value unsets the variable for the lifetime of the helper.
 */
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        const char* old = std::getenv(name);
        if (old) {
            old_value_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (old_value_) {
            setenv(name_, old_value_->c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
    std::optional<std::string> old_value_;
};

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& suffix = ".json") {
        path_ = std::filesystem::temp_directory_path() /
                ("http2mqtt_test_" + std::to_string(counter_++) + suffix);
        std::ofstream ofs(path_);
        ofs << content;
    }

    ~TempFile() { std::filesystem::remove(path_); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

/**
 * @brief Get path to the schema file (production schema used in tests).
 */
std::filesystem::path get_schema_path() {
    const auto this_file = std::filesystem::weakly_canonical(std::filesystem::path(__FILE__));
    const auto project_root = this_file.parent_path().parent_path().parent_path();
    return project_root / "schema" / "config.schema.json";
}

/**
 * @brief Clears every override variable so host environment does not leak into tests.
 */
class ConfigLoaderTest : public ::testing::Test {
protected:
    ScopedEnv log_level_{env::LOG_LEVEL, nullptr};
    ScopedEnv http_port_{env::HTTP_PORT, nullptr};
    ScopedEnv mqtt_host_{env::MQTT_HOST, nullptr};
    ScopedEnv mqtt_user_{env::MQTT_USER, nullptr};
    ScopedEnv mqtt_pass_{env::MQTT_PASS, nullptr};
};

//
// Valid configuration tests
//

// Minimal valid config JSON (infrastructure.mqtt is required)
const char* MINIMAL_CONFIG = R"({
  "infrastructure": {
    "mqtt": {"host": "localhost", "port": 1883}
  }
})";

const char* FULL_CONFIG = R"({
  "infrastructure": {
    "http": {"host": "127.0.0.1", "port": 9000},
    "mqtt": {
      "host": "broker.local",
      "port": 1884,
      "insecure": true,
      "client_id": "unique_client_id",
      "username": "user",
      "password": "secret"
    }
  },
  "gateway": {
    "topic_whitelist": ["test/topic", "topic"],
    "topic_prefix": "home/unique_client_id/",
    "max_message_length": 50
  },
  "observability": {"logging": {"level": "debug"}}
})";

// Helper to create config with observability.logging.level
std::string config_with_log_level(const std::string& level) {
    return R"({
      "infrastructure": {"mqtt": {"host": "localhost", "port": 1883}},
      "observability": {"logging": {"level": ")" +
           level + R"("}}
    })";
}

// Helper to create config with infrastructure.http.port
std::string config_with_http_port(int port) {
    return R"({
      "infrastructure": {
        "mqtt": {"host": "localhost", "port": 1883},
        "http": {"port": )" +
           std::to_string(port) + R"(}
      }
    })";
}

// Helper to create config with a gateway section
std::string config_with_gateway(const std::string& gateway_json) {
    return R"({
      "infrastructure": {"mqtt": {"host": "localhost", "port": 1883}},
      "gateway": )" +
           gateway_json + "}";
}

TEST_F(ConfigLoaderTest, LoadFullConfig) {
    TempFile config_file(FULL_CONFIG);

    auto config = load_config(config_file.path(), get_schema_path());

    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.http.host, "127.0.0.1");
    EXPECT_EQ(config.http.port, 9000);
    EXPECT_EQ(config.mqtt.host, "broker.local");
    EXPECT_EQ(config.mqtt.port, 1884);
    EXPECT_TRUE(config.mqtt.insecure);
    EXPECT_FALSE(config.mqtt.tls.has_value());
    EXPECT_EQ(config.mqtt.client_id, "unique_client_id");
    EXPECT_TRUE(config.mqtt.has_credentials());
    EXPECT_EQ(config.gateway.topic_whitelist, (TopicWhitelist{"test/topic", "topic"}));
    EXPECT_EQ(config.gateway.topic_prefix, "home/unique_client_id/");
    EXPECT_EQ(config.gateway.max_message_length, 50u);
}

TEST_F(ConfigLoaderTest, DefaultValues) {
    TempFile config_file(MINIMAL_CONFIG);
    auto config = load_config(config_file.path(), get_schema_path());

    EXPECT_EQ(config.log_level, "error");
    EXPECT_EQ(config.http.host, "0.0.0.0");
    EXPECT_EQ(config.http.port, 8234);
    EXPECT_TRUE(config.mqtt.insecure);
    EXPECT_TRUE(config.mqtt.client_id.empty());
    EXPECT_FALSE(config.mqtt.has_credentials());
    EXPECT_TRUE(config.gateway.topic_whitelist.empty());
    EXPECT_TRUE(config.gateway.topic_prefix.empty());
    EXPECT_EQ(config.gateway.max_message_length, 100u);
}

TEST_F(ConfigLoaderTest, LoadAllLogLevelsAndPortBoundaries) {
    for (const auto& level : {"trace", "debug", "info", "warn", "warning", "error"}) {
        TempFile config_file(config_with_log_level(level));
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.log_level, level);
    }

    {
        TempFile config_file(config_with_http_port(1024));
        EXPECT_EQ(load_config(config_file.path(), get_schema_path()).http.port, 1024);
    }
    {
        TempFile config_file(config_with_http_port(65535));
        EXPECT_EQ(load_config(config_file.path(), get_schema_path()).http.port, 65535);
    }
}

TEST_F(ConfigLoaderTest, LargestMessageLengthIsAccepted) {
    TempFile config_file(config_with_gateway(R"({"max_message_length": 4294967295})"));
    auto config = load_config(config_file.path(), get_schema_path());
    EXPECT_EQ(config.gateway.max_message_length, std::size_t{4294967295u});
}

TEST_F(ConfigLoaderTest, EmptyWhitelistDisablesTopicCheck) {
    TempFile config_file(config_with_gateway(R"({"topic_whitelist": []})"));
    auto config = load_config(config_file.path(), get_schema_path());
    EXPECT_TRUE(config.gateway.topic_whitelist.empty());
}

TEST_F(ConfigLoaderTest, TlsSectionLoaded) {
    TempFile config_file(R"({
      "infrastructure": {
        "mqtt": {
          "host": "broker", "port": 8883, "insecure": false,
          "tls": {"ca_cert_path": "/certs/ca.crt", "verify_server": false}
        }
      }
    })");

    auto config = load_config(config_file.path(), get_schema_path());

    EXPECT_FALSE(config.mqtt.insecure);
    ASSERT_TRUE(config.mqtt.tls.has_value());
    EXPECT_EQ(config.mqtt.tls->ca_cert_path, "/certs/ca.crt");
    EXPECT_TRUE(config.mqtt.tls->client_cert_path.empty());
    EXPECT_FALSE(config.mqtt.tls->verify_server);
}

//
// Environment variable override tests
//

TEST_F(ConfigLoaderTest, EnvOverrides) {
    TempFile config_file(FULL_CONFIG);

    {
        ScopedEnv env(http2mqtt::env::LOG_LEVEL, "trace");
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.log_level, "trace");
        EXPECT_EQ(config.http.port, 9000);
    }

    for (const auto& level : {"warn", "warning"}) {
        ScopedEnv env(http2mqtt::env::LOG_LEVEL, level);
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.log_level, level);
    }

    {
        ScopedEnv env(http2mqtt::env::HTTP_PORT, "9999");
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.log_level, "debug");
        EXPECT_EQ(config.http.port, 9999);
    }

    {
        ScopedEnv env_host(env::MQTT_HOST, "10.0.0.5");
        ScopedEnv env_user(env::MQTT_USER, "env_user");
        ScopedEnv env_pass(env::MQTT_PASS, "env_pass");
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_EQ(config.mqtt.host, "10.0.0.5");
        EXPECT_EQ(config.mqtt.username, "env_user");
        EXPECT_EQ(config.mqtt.password, "env_pass");
    }
}

TEST_F(ConfigLoaderTest, CredentialsRequireBothUserAndPassword) {
    TempFile config_file(MINIMAL_CONFIG);

    {
        ScopedEnv env_user(env::MQTT_USER, "user");
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_FALSE(config.mqtt.has_credentials());
    }
    {
        ScopedEnv env_user(env::MQTT_USER, "user");
        ScopedEnv env_pass(env::MQTT_PASS, "");
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_FALSE(config.mqtt.has_credentials());
    }
    {
        ScopedEnv env_user(env::MQTT_USER, "user");
        ScopedEnv env_pass(env::MQTT_PASS, "pass");
        auto config = load_config(config_file.path(), get_schema_path());
        EXPECT_TRUE(config.mqtt.has_credentials());
    }
}

//
// Error handling tests
//

TEST_F(ConfigLoaderTest, MissingFilesThrow) {
    TempFile valid_config(MINIMAL_CONFIG);

    EXPECT_THROW(load_config("/nonexistent/config.json", get_schema_path()), std::runtime_error);
    EXPECT_THROW(load_config(valid_config.path(), "/nonexistent/schema.json"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, InvalidJsonThrows) {
    {
        TempFile config_file(R"({invalid json})");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
    }

    {
        TempFile valid_config(MINIMAL_CONFIG);
        TempFile bad_schema(R"({not valid json)");
        EXPECT_THROW(load_config(valid_config.path(), bad_schema.path()), std::runtime_error);
    }
}

TEST_F(ConfigLoaderTest, SchemaValidationErrors) {
    const std::vector<std::string> invalid_configs = {
        // Missing required infrastructure.mqtt
        R"({})",
        R"({"infrastructure": {}})",
        // Invalid log level
        config_with_log_level("invalid"),
        // Port out of range
        config_with_http_port(1023),
        config_with_http_port(65536),
        // Extra properties not allowed at root level
        R"({"infrastructure": {"mqtt": {"host": "localhost", "port": 1883}}, "extra": "value"})",
        // Whitelist entries that could never match a sanitized topic
        config_with_gateway(R"({"topic_whitelist": ["bad topic"]})"),
        config_with_gateway(R"({"topic_whitelist": ["home/#"]})"),
        // Wildcards in the prefix
        config_with_gateway(R"({"topic_prefix": "home/+/"})"),
        // Maximum length out of range
        config_with_gateway(R"({"max_message_length": 0})"),
        config_with_gateway(R"({"max_message_length": 4294967296})"),
        config_with_gateway(R"({"max_message_length": 18446744073709551615})"),
    };

    for (const auto& content : invalid_configs) {
        TempFile config_file(content);
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error)
            << content;
    }
}

TEST_F(ConfigLoaderTest, SecureWithoutTlsSectionThrows) {
    TempFile config_file(R"({
      "infrastructure": {"mqtt": {"host": "broker", "port": 8883, "insecure": false}}
    })");
    EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
}

TEST_F(ConfigLoaderTest, TlsSectionWithoutCaCertThrows) {
    TempFile config_file(R"({
      "infrastructure": {
        "mqtt": {"host": "broker", "port": 8883, "insecure": false, "tls": {"verify_server": true}}
      }
    })");
    EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
}

TEST_F(ConfigLoaderTest, EnvValidationErrors) {
    TempFile config_file(MINIMAL_CONFIG);

    {
        ScopedEnv env(http2mqtt::env::LOG_LEVEL, "invalid_level");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
    }
    {
        ScopedEnv env(http2mqtt::env::HTTP_PORT, "not_a_number");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
    }
    {
        ScopedEnv env(http2mqtt::env::HTTP_PORT, "8080abc");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
    }
    {
        ScopedEnv env(http2mqtt::env::HTTP_PORT, "1000");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
    }
    {
        ScopedEnv env(http2mqtt::env::HTTP_PORT, "99999999999999999999");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
    }
    {
        ScopedEnv env(http2mqtt::env::MQTT_HOST, "");
        EXPECT_THROW(load_config(config_file.path(), get_schema_path()), std::runtime_error);
    }
}

} // namespace
} // namespace http2mqtt
