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

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace tracebridge {

    constexpr const char* LOG_LEVEL_DEBUG = "debug";
    constexpr const char* LOG_LEVEL_INFO = "info";
    constexpr const char* LOG_LEVEL_WARN = "warn";
    constexpr const char* LOG_LEVEL_ERROR = "error";

    /**
     * @brief Thread-safe singleton wrapper around the internal `spdlog` logger.
     *
     * Every component writes through this logger, so sinks and levels are configured
     * in one place when the hub reads its configuration.
     */
    class Logger {
    public:
        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        /**
         * @brief Returns the lazily-constructed global logger instance.
         */
        static Logger& getInstance() {
            std::call_once(init_flag_, []() {
                instance_.reset(new Logger);
            });
            return *(instance_);
        }

        std::shared_ptr<spdlog::logger>& getLogger() { return logger_; }
        /**
         * @brief Adjusts the log level. Unknown level names leave the level unchanged.
         *
         * @param log_level One of `debug`, `info`, `warn`, `error` (case-insensitive).
         */
        void setLogLevel(const std::string& log_level);
        /**
         * @brief Switches the logger to a rotating file sink.
         *
         * @param log_file_path Path to the log file.
         * @param max_size Maximum file size (MB) before rotation.
         */
        void setFileLogger(const std::string& log_file_path, int max_size);

    private:
        static std::unique_ptr<Logger> instance_;
        static std::once_flag init_flag_;
        std::mutex mutex_;
        std::shared_ptr<spdlog::logger> logger_;

        Logger();
    };

    /// @brief Resets the global logger to `info` level.
    void init_logger();
    /// @brief Flushes pending log messages and releases logger resources.
    void shutdown_logger();

    #define LOG_DEBUG(...) (Logger::getInstance().getLogger()->debug(__VA_ARGS__))
    #define LOG_INFO(...) (Logger::getInstance().getLogger()->info(__VA_ARGS__))
    #define LOG_WARN(...) (Logger::getInstance().getLogger()->warn(__VA_ARGS__))
    #define LOG_ERROR(...) (Logger::getInstance().getLogger()->error(__VA_ARGS__))
}
