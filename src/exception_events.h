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

#include <string_view>

#include "tracebridge/tracer.h"
#include "attributes.h"

namespace tracebridge {

    constexpr const char* EXCEPTION_MECHANISM = "ActivitySpanProcessor.ErrorSpan";
    constexpr const char* CONTEXT_STACK_TRACE = "stack_trace";

    /**
     * @brief Builds the minimal exception reported for an exception event marker.
     *
     * @param type Qualified type name, e.g. `System.InvalidOperationException` or `std::runtime_error`.
     * @param message Exception message, may be empty.
     * @throws std::invalid_argument when `type` is not a qualified identifier.
     */
    SyntheticException make_synthetic_exception(std::string_view type, std::string_view message);

    /**
     * @brief Reports one error event per `exception` marker recorded on the activity.
     *
     * Markers without an `exception.type` string, or whose exception cannot be built,
     * are skipped. Each event carries `otel_context` plus the raw stack trace and is
     * stamped with the activity's trace, span and parent span ids.
     *
     * @return Number of events handed to the hub.
     */
    size_t capture_exception_events(Hub& hub, const Activity& activity, const ContextObject& otel_context);

}  // namespace tracebridge
