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

#include <chrono>
#include <string>
#include <optional>
#include <string_view>

#include "tracebridge/tracer.h"

namespace tracebridge {

    /**
     * @brief Generates a random, non-zero span identifier.
     */
    SpanId generate_span_id();
    /**
     * @brief Generates a random, non-zero trace identifier.
     */
    TraceId generate_trace_id();
    /**
     * @brief Generates an event identifier as 32 lowercase hex characters.
     */
    std::string generate_event_id();

    /// @brief Returns milliseconds elapsed on the steady clock since an arbitrary epoch.
    int64_t steady_milli_seconds();

    /// @brief Safe string-to-int conversion returning `std::nullopt` on error.
    std::optional<int> stoi_(std::string_view str);
    /// @brief Safe string-to-double conversion returning `std::nullopt` on error.
    std::optional<double> stod_(std::string_view str);
    /// @brief Safe string-to-bool conversion returning `std::nullopt` on error.
    std::optional<bool> stob_(std::string_view str);

    /**
     * @brief Case-insensitive string comparison helper that avoids allocation.
     *
     * @return `true` if both strings are equal (ignoring case).
     */
    bool compare_string(std::string_view str1, std::string_view str2);

}
