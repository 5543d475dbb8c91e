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

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace tracebridge {

    namespace env {
        constexpr const char* ENABLE = "TRACEBRIDGE_ENABLE";
        constexpr const char* DSN = "TRACEBRIDGE_DSN";
        constexpr const char* INSTRUMENTER = "TRACEBRIDGE_INSTRUMENTER";
        constexpr const char* LOG_LEVEL = "TRACEBRIDGE_LOG_LEVEL";
        constexpr const char* LOG_FILE_PATH = "TRACEBRIDGE_LOG_FILE_PATH";
        constexpr const char* LOG_MAX_FILE_SIZE = "TRACEBRIDGE_LOG_MAX_FILE_SIZE";
        constexpr const char* BACKEND_EXCLUDE_URL = "TRACEBRIDGE_BACKEND_EXCLUDE_URL";
        constexpr const char* TRACING_PRUNE_INTERVAL = "TRACEBRIDGE_TRACING_PRUNE_INTERVAL";
        constexpr const char* TRACING_STATUS_PRECEDENCE = "TRACEBRIDGE_TRACING_STATUS_PRECEDENCE";
        constexpr const char* CONFIG_FILE = "TRACEBRIDGE_CONFIG_FILE";
    }

    constexpr const char* INSTRUMENTER_OTEL_NAME = "otel";
    constexpr const char* INSTRUMENTER_NATIVE_NAME = "native";
    constexpr const char* STATUS_PRECEDENCE_DERIVED = "derived";
    constexpr const char* STATUS_PRECEDENCE_CALLBACK = "callback";

    constexpr int DEFAULT_PRUNE_INTERVAL_MS = 5000;
    constexpr int MIN_PRUNE_INTERVAL_MS = 100;

    struct Config {
        bool enable;
        std::string dsn;
        std::string instrumenter;

        struct {
            std::string level;
            std::string file_path;
            int max_file_size;
        } log;

        struct {
            std::vector<std::string> exclude_url;
        } backend;

        struct {
            int prune_interval;
            std::string status_precedence;
        } tracing;

        bool otelInstrumenter() const { return instrumenter == INSTRUMENTER_OTEL_NAME; }
        bool callbackStatusPrecedence() const { return tracing.status_precedence == STATUS_PRECEDENCE_CALLBACK; }
    };

    void read_config_from_file(const char* config_file_path);
    void set_config_string(std::string_view cfg_str);
    /// @brief Resolves defaults, the YAML document, then environment overrides, and clamps the result.
    Config make_config();
    std::string to_config_string(const Config& config);
}  // namespace tracebridge
