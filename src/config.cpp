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

#include <cstdlib>
#include <fstream>
#include <string>
#include <sstream>

#include "absl/strings/str_split.h"

#include "logging.h"
#include "utility.h"
#include "config.h"

namespace tracebridge {

    static std::string user_config{};

    static void init_config(Config& config) {
        config.enable = true;
        config.dsn = "";
        config.instrumenter = INSTRUMENTER_OTEL_NAME;
        config.log.level = "info";
        config.log.file_path = "";
        config.log.max_file_size = 10; //MB
        config.backend.exclude_url = {};
        config.tracing.prune_interval = DEFAULT_PRUNE_INTERVAL_MS;
        config.tracing.status_precedence = STATUS_PRECEDENCE_DERIVED;
    }

    static bool get_boolean(const YAML::Node& yaml, std::string_view cname, bool default_value) {
        if (yaml[cname]) {
            try {
                return yaml[cname].as<bool>();
            } catch (const YAML::TypedBadConversion<bool>& e) {
                LOG_WARN("Failed to convert '{}' to boolean: {}. Using default value: {}",
                         std::string(cname), e.what(), default_value);
                return default_value;
            }
        }

        return default_value;
    }

    static std::string get_string(const YAML::Node& yaml, std::string_view cname, std::string default_value) {
        if (yaml[cname]) {
            try {
                return yaml[cname].as<std::string>();
            } catch (const YAML::TypedBadConversion<std::string>& e) {
                LOG_WARN("Failed to convert '{}' to string: {}. Using default value: '{}'",
                         std::string(cname), e.what(), default_value);
                return default_value;
            }
        }

        return default_value;
    }

    static std::vector<std::string> get_string_vector(const YAML::Node& yaml, std::string_view cname,
                                                      std::vector<std::string> default_value) {
        if (yaml[cname]) {
            try {
                return yaml[cname].as<std::vector<std::string>>();
            } catch (const YAML::TypedBadConversion<std::vector<std::string>>& e) {
                LOG_WARN("Failed to convert '{}' to string vector: {}. Using default value",
                         std::string(cname), e.what());
                return default_value;
            }
        }

        return default_value;
    }

    static int get_int(const YAML::Node& yaml, std::string_view cname, int default_value) {
        if (yaml[cname]) {
            try {
                return yaml[cname].as<int>();
            } catch (const YAML::TypedBadConversion<int>& e) {
                LOG_WARN("Failed to convert '{}' to int: {}. Using default value: {}",
                         std::string(cname), e.what(), default_value);
                return default_value;
            }
        }

        return default_value;
    }

    static void load_yaml_config(const YAML::Node& yaml, Config& config) {
        if (yaml.size() < 1) {
            return;
        }

        config.enable = get_boolean(yaml, "Enable", true);
        config.dsn = get_string(yaml, "Dsn", "");
        config.instrumenter = get_string(yaml, "Instrumenter", INSTRUMENTER_OTEL_NAME);

        if (auto& log = yaml["Log"]) {
            config.log.level = get_string(log, "Level", "info");
            config.log.file_path = get_string(log, "FilePath", "");
            config.log.max_file_size = get_int(log, "MaxFileSize", 10);
        }

        if (auto& backend = yaml["Backend"]) {
            config.backend.exclude_url = get_string_vector(backend, "ExcludeUrl", {});
        }

        if (auto& tracing = yaml["Tracing"]) {
            config.tracing.prune_interval = get_int(tracing, "PruneInterval", DEFAULT_PRUNE_INTERVAL_MS);
            config.tracing.status_precedence = get_string(tracing, "StatusPrecedence", STATUS_PRECEDENCE_DERIVED);
        }
    }

    static bool safe_env_stob(const char* env_name, const char* env_value, bool default_value) {
        auto result = stob_(env_value);
        if (result.has_value()) {
            return result.value();
        } else {
            LOG_WARN("Failed to parse boolean value '{}' for environment variable '{}'. Using default value: {}",
                     env_value, env_name, default_value);
            return default_value;
        }
    }

    static int safe_env_stoi(const char* env_name, const char* env_value, int default_value) {
        auto result = stoi_(env_value);
        if (result.has_value()) {
            return result.value();
        } else {
            LOG_WARN("Invalid integer value '{}' for environment variable '{}'. Using default value: {}",
                     env_value, env_name, default_value);
            return default_value;
        }
    }

    static void load_env_config(Config& config) {
        if (const char* env_p = std::getenv(env::ENABLE)) {
            config.enable = safe_env_stob(env::ENABLE, env_p, true);
        }
        if (const char* env_p = std::getenv(env::DSN)) {
            config.dsn = std::string(env_p);
        }
        if (const char* env_p = std::getenv(env::INSTRUMENTER)) {
            config.instrumenter = std::string(env_p);
        }

        if (const char* env_p = std::getenv(env::LOG_LEVEL)) {
            config.log.level = std::string(env_p);
        }
        if (const char* env_p = std::getenv(env::LOG_FILE_PATH)) {
            config.log.file_path = std::string(env_p);
        }
        if (const char* env_p = std::getenv(env::LOG_MAX_FILE_SIZE)) {
            config.log.max_file_size = safe_env_stoi(env::LOG_MAX_FILE_SIZE, env_p, 10);
        }

        if (const char* env_p = std::getenv(env::BACKEND_EXCLUDE_URL)) {
            config.backend.exclude_url = absl::StrSplit(env_p, ',', absl::SkipEmpty());
        }

        if (const char* env_p = std::getenv(env::TRACING_PRUNE_INTERVAL)) {
            config.tracing.prune_interval = safe_env_stoi(env::TRACING_PRUNE_INTERVAL, env_p, DEFAULT_PRUNE_INTERVAL_MS);
        }
        if (const char* env_p = std::getenv(env::TRACING_STATUS_PRECEDENCE)) {
            config.tracing.status_precedence = std::string(env_p);
        }
    }

    void read_config_from_file(const char* config_file_path) {
        if (std::ifstream file(config_file_path); file.is_open()) {
            std::stringstream buffer;
            buffer << file.rdbuf();
            user_config = buffer.str();
            file.close();
        } else {
            LOG_ERROR("can't open config file = {}", config_file_path);
        }
    }

    void set_config_string(std::string_view cfg_str) {
        user_config = cfg_str;
    }

    static void clamp_config(Config& config) {
        if (!compare_string(config.instrumenter, INSTRUMENTER_OTEL_NAME) &&
            !compare_string(config.instrumenter, INSTRUMENTER_NATIVE_NAME)) {
            LOG_WARN("unknown instrumenter '{}', using '{}'", config.instrumenter, INSTRUMENTER_OTEL_NAME);
            config.instrumenter = INSTRUMENTER_OTEL_NAME;
        } else if (compare_string(config.instrumenter, INSTRUMENTER_OTEL_NAME)) {
            config.instrumenter = INSTRUMENTER_OTEL_NAME;
        } else {
            config.instrumenter = INSTRUMENTER_NATIVE_NAME;
        }

        if (compare_string(config.tracing.status_precedence, STATUS_PRECEDENCE_CALLBACK)) {
            config.tracing.status_precedence = STATUS_PRECEDENCE_CALLBACK;
        } else {
            if (!compare_string(config.tracing.status_precedence, STATUS_PRECEDENCE_DERIVED)) {
                LOG_WARN("unknown status precedence '{}', using '{}'",
                         config.tracing.status_precedence, STATUS_PRECEDENCE_DERIVED);
            }
            config.tracing.status_precedence = STATUS_PRECEDENCE_DERIVED;
        }

        if (config.tracing.prune_interval < MIN_PRUNE_INTERVAL_MS) {
            config.tracing.prune_interval = MIN_PRUNE_INTERVAL_MS;
        }
        if (config.log.max_file_size < 1) {
            config.log.max_file_size = 10;
        }
    }

    Config make_config() {
        Config config;

        init_config(config);
        init_logger();

        if (const char* env_p = std::getenv(env::CONFIG_FILE); env_p != nullptr) {
            read_config_from_file(env_p);
        }

        YAML::Node yaml;
        if (!user_config.empty()) {
            try {
                yaml = YAML::Load(user_config);
            } catch (const YAML::ParserException& e) {
                LOG_ERROR("yaml parsing exception = {}", e.what());
                return config;
            }
        }

        load_yaml_config(yaml, config);
        load_env_config(config);
        clamp_config(config);

        if (!config.log.file_path.empty()) {
            Logger::getInstance().setFileLogger(config.log.file_path, config.log.max_file_size);
        }
        Logger::getInstance().setLogLevel(config.log.level);

        LOG_INFO("config: {}", "\n" + to_config_string(config));
        return config;
    }

    std::string to_config_string(const Config& config) {
        YAML::Emitter emitter;

        emitter << YAML::BeginMap;
        emitter << YAML::Key << "Enable" << YAML::Value << config.enable;
        emitter << YAML::Key << "Dsn" << YAML::Value << config.dsn;
        emitter << YAML::Key << "Instrumenter" << YAML::Value << config.instrumenter;

        emitter << YAML::Key << "Log";
        emitter << YAML::BeginMap;
        emitter << YAML::Key << "Level" << YAML::Value << config.log.level;
        emitter << YAML::Key << "FilePath" << YAML::Value << config.log.file_path;
        emitter << YAML::Key << "MaxFileSize" << YAML::Value << config.log.max_file_size;
        emitter << YAML::EndMap;

        emitter << YAML::Key << "Backend";
        emitter << YAML::BeginMap;
        emitter << YAML::Key << "ExcludeUrl" << YAML::Value << YAML::BeginSeq;
        for (const auto& s : config.backend.exclude_url) {
            emitter << s;
        }
        emitter << YAML::EndSeq;
        emitter << YAML::EndMap;

        emitter << YAML::Key << "Tracing";
        emitter << YAML::BeginMap;
        emitter << YAML::Key << "PruneInterval" << YAML::Value << config.tracing.prune_interval;
        emitter << YAML::Key << "StatusPrecedence" << YAML::Value << config.tracing.status_precedence;
        emitter << YAML::EndMap;

        emitter << YAML::EndMap;

        return emitter.c_str();
    }
}
