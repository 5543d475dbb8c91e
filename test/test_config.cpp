/*
 * Copyright 2020-present NAVER Corp.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "../src/config.h"
#include <gtest/gtest.h>
#include <string>
#include <map>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace tracebridge {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Save current environment variables
        SaveEnvironmentVariables();

        // Clear any existing config
        set_config_string("");

        // Create a temporary directory for test files
        temp_dir_ = "/tmp/tracebridge_config_test_" + std::to_string(getpid());
        mkdir(temp_dir_.c_str(), 0755);
    }

    void TearDown() override {
        RestoreEnvironmentVariables();
        set_config_string("");

        std::remove((temp_dir_ + "/tracebridge.yaml").c_str());
        rmdir(temp_dir_.c_str());
    }

private:
    void SaveEnvironmentVariables() {
        for (const char* name : {env::ENABLE, env::DSN, env::INSTRUMENTER, env::LOG_LEVEL, env::LOG_FILE_PATH,
                                 env::LOG_MAX_FILE_SIZE, env::BACKEND_EXCLUDE_URL, env::TRACING_PRUNE_INTERVAL,
                                 env::TRACING_STATUS_PRECEDENCE, env::CONFIG_FILE}) {
            saved_env_vars_[name] = GetEnvVar(name);
        }

        // Clear environment variables for clean test
        for (const auto& pair : saved_env_vars_) {
            unsetenv(pair.first.c_str());
        }
    }

    void RestoreEnvironmentVariables() {
        for (const auto& pair : saved_env_vars_) {
            if (!pair.second.empty()) {
                setenv(pair.first.c_str(), pair.second.c_str(), 1);
            } else {
                unsetenv(pair.first.c_str());
            }
        }
    }

    std::string GetEnvVar(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        return value ? std::string(value) : std::string();
    }

protected:
    std::map<std::string, std::string> saved_env_vars_;
    std::string temp_dir_;

    const std::string complete_config_yaml_ = R"(
Enable: true
Dsn: "https://public@o1.ingest.example.com/42"
Instrumenter: "otel"

Log:
  Level: "debug"
  FilePath: ""
  MaxFileSize: 20

Backend:
  ExcludeUrl: ["https://relay.internal/**", "/health"]

Tracing:
  PruneInterval: 2000
  StatusPrecedence: "callback"
)";
};

TEST_F(ConfigTest, DefaultConfigTest) {
    Config config = make_config();

    EXPECT_TRUE(config.enable);
    EXPECT_EQ(config.dsn, "");
    EXPECT_EQ(config.instrumenter, INSTRUMENTER_OTEL_NAME);
    EXPECT_TRUE(config.otelInstrumenter());
    EXPECT_EQ(config.log.level, "info");
    EXPECT_EQ(config.log.max_file_size, 10);
    EXPECT_TRUE(config.backend.exclude_url.empty());
    EXPECT_EQ(config.tracing.prune_interval, DEFAULT_PRUNE_INTERVAL_MS);
    EXPECT_EQ(config.tracing.status_precedence, STATUS_PRECEDENCE_DERIVED);
    EXPECT_FALSE(config.callbackStatusPrecedence());
}

TEST_F(ConfigTest, YamlConfigTest) {
    set_config_string(complete_config_yaml_);
    Config config = make_config();

    EXPECT_TRUE(config.enable);
    EXPECT_EQ(config.dsn, "https://public@o1.ingest.example.com/42");
    EXPECT_EQ(config.log.level, "debug");
    EXPECT_EQ(config.log.max_file_size, 20);
    ASSERT_EQ(config.backend.exclude_url.size(), 2);
    EXPECT_EQ(config.backend.exclude_url[0], "https://relay.internal/**");
    EXPECT_EQ(config.backend.exclude_url[1], "/health");
    EXPECT_EQ(config.tracing.prune_interval, 2000);
    EXPECT_TRUE(config.callbackStatusPrecedence());
}

TEST_F(ConfigTest, EnvironmentOverridesYamlTest) {
    set_config_string(complete_config_yaml_);
    setenv(env::DSN, "https://other@collector.example.com/7", 1);
    setenv(env::INSTRUMENTER, "native", 1);
    setenv(env::TRACING_PRUNE_INTERVAL, "750", 1);
    setenv(env::TRACING_STATUS_PRECEDENCE, "derived", 1);
    setenv(env::BACKEND_EXCLUDE_URL, "/a,,/b/**", 1);

    Config config = make_config();

    EXPECT_EQ(config.dsn, "https://other@collector.example.com/7");
    EXPECT_EQ(config.instrumenter, INSTRUMENTER_NATIVE_NAME);
    EXPECT_FALSE(config.otelInstrumenter());
    EXPECT_EQ(config.tracing.prune_interval, 750);
    EXPECT_FALSE(config.callbackStatusPrecedence());
    ASSERT_EQ(config.backend.exclude_url.size(), 2);
    EXPECT_EQ(config.backend.exclude_url[0], "/a");
    EXPECT_EQ(config.backend.exclude_url[1], "/b/**");
}

TEST_F(ConfigTest, EnvironmentDisableTest) {
    setenv(env::ENABLE, "false", 1);

    Config config = make_config();
    EXPECT_FALSE(config.enable);
}

TEST_F(ConfigTest, InvalidEnvironmentValueUsesDefaultTest) {
    setenv(env::TRACING_PRUNE_INTERVAL, "soon", 1);
    setenv(env::ENABLE, "maybe", 1);

    Config config = make_config();
    EXPECT_EQ(config.tracing.prune_interval, DEFAULT_PRUNE_INTERVAL_MS);
    EXPECT_TRUE(config.enable);
}

TEST_F(ConfigTest, ClampingTest) {
    set_config_string(R"(
Instrumenter: "zipkin"
Log:
  MaxFileSize: 0
Tracing:
  PruneInterval: 10
  StatusPrecedence: "whatever"
)");
    Config config = make_config();

    EXPECT_EQ(config.instrumenter, INSTRUMENTER_OTEL_NAME);
    EXPECT_EQ(config.log.max_file_size, 10);
    EXPECT_EQ(config.tracing.prune_interval, MIN_PRUNE_INTERVAL_MS);
    EXPECT_EQ(config.tracing.status_precedence, STATUS_PRECEDENCE_DERIVED);
}

TEST_F(ConfigTest, CaseInsensitiveNamesTest) {
    setenv(env::INSTRUMENTER, "NATIVE", 1);
    setenv(env::TRACING_STATUS_PRECEDENCE, "Callback", 1);

    Config config = make_config();
    EXPECT_EQ(config.instrumenter, INSTRUMENTER_NATIVE_NAME);
    EXPECT_EQ(config.tracing.status_precedence, STATUS_PRECEDENCE_CALLBACK);
}

TEST_F(ConfigTest, WrongYamlTypeUsesDefaultTest) {
    set_config_string(R"(
Tracing:
  PruneInterval: "often"
)");
    Config config = make_config();

    EXPECT_EQ(config.tracing.prune_interval, DEFAULT_PRUNE_INTERVAL_MS);
}

TEST_F(ConfigTest, InvalidYamlReturnsDefaultsTest) {
    set_config_string("Tracing: [unclosed");
    Config config = make_config();

    EXPECT_EQ(config.tracing.prune_interval, DEFAULT_PRUNE_INTERVAL_MS);
    EXPECT_EQ(config.dsn, "");
}

TEST_F(ConfigTest, ConfigFileFromEnvironmentTest) {
    const std::string path = temp_dir_ + "/tracebridge.yaml";
    {
        std::ofstream file(path);
        file << complete_config_yaml_;
    }
    setenv(env::CONFIG_FILE, path.c_str(), 1);

    Config config = make_config();
    EXPECT_EQ(config.dsn, "https://public@o1.ingest.example.com/42");
    EXPECT_EQ(config.tracing.prune_interval, 2000);
}

TEST_F(ConfigTest, ConfigStringTest) {
    set_config_string(complete_config_yaml_);
    Config config = make_config();

    const std::string out = to_config_string(config);
    EXPECT_NE(out.find("Dsn: https://public@o1.ingest.example.com/42"), std::string::npos);
    EXPECT_NE(out.find("PruneInterval: 2000"), std::string::npos);
    EXPECT_NE(out.find("StatusPrecedence: callback"), std::string::npos);
}

}  // namespace tracebridge
