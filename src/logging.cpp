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

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "logging.h"
#include "utility.h"

namespace tracebridge {

    std::unique_ptr<Logger> Logger::instance_;
    std::once_flag Logger::init_flag_;

    Logger::Logger() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger_ = std::make_shared<spdlog::logger>("tracebridge", console_sink);
        logger_->set_level(spdlog::level::info);
        spdlog::register_logger(logger_);
    }

    void init_logger() {
        Logger::getInstance().setLogLevel(LOG_LEVEL_INFO);
    }

    void shutdown_logger() {
        spdlog::shutdown();
    }

    void Logger::setLogLevel(const std::string& log_level) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (compare_string(log_level, LOG_LEVEL_DEBUG)) {
            logger_->set_level(spdlog::level::debug);
        } else if (compare_string(log_level, LOG_LEVEL_INFO)) {
            logger_->set_level(spdlog::level::info);
        } else if (compare_string(log_level, LOG_LEVEL_WARN)) {
            logger_->set_level(spdlog::level::warn);
        } else if (compare_string(log_level, LOG_LEVEL_ERROR)) {
            logger_->set_level(spdlog::level::err);
        }
    }

    void Logger::setFileLogger(const std::string& log_file_path, int max_size) {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto size = static_cast<size_t>(max_size) * 1024 * 1024;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file_path, size, 1);

        // spdlog sinks are not swapped atomically; callers configure this once at hub creation.
        auto& sinks = logger_->sinks();
        sinks.clear();
        sinks.push_back(file_sink);
        logger_->flush_on(spdlog::level::err);
    }
}
