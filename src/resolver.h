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

#include "tracebridge/tracer.h"
#include "attributes.h"

namespace tracebridge {

    /**
     * @brief Operation, description and name source derived from semantic-convention attributes.
     */
    struct SpanDescription {
        std::string operation;
        std::string description;
        TransactionNameSource source;
    };

    /**
     * @brief Derives a span status from an activity status code and its attributes.
     *
     * An `otel.status_code` of `ERROR` forces the error derivation regardless of the
     * status code. The error derivation prefers an integer `http.status_code`, then
     * an integer `rpc.grpc.status_code`, and falls back to `unknown_error`.
     */
    SpanStatus resolve_status(ActivityStatusCode status, const AttributeMap& attributes);

    /**
     * @brief Derives operation, description and name source for an activity.
     *
     * Rules are evaluated in order and the first match wins:
     * HTTP client, HTTP route, HTTP target, other HTTP server, database, RPC,
     * messaging, FaaS trigger, and finally the activity's own names.
     */
    SpanDescription resolve_description(const Activity& activity, const AttributeMap& attributes);
    /// @overload
    SpanDescription resolve_description(ActivityKind kind, std::string_view operation_name,
                                        std::string_view display_name, const AttributeMap& attributes);

}
