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

#include <regex>
#include <stdexcept>

#include "absl/strings/str_cat.h"

#include "logging.h"
#include "exception_events.h"

namespace tracebridge {

    SyntheticException make_synthetic_exception(std::string_view type, std::string_view message) {
        static const std::regex qualified_name(
            R"(^[A-Za-z_][A-Za-z0-9_]*((\.|::|\+)[A-Za-z_][A-Za-z0-9_]*)*$)");

        if (!std::regex_match(type.begin(), type.end(), qualified_name)) {
            throw std::invalid_argument(absl::StrCat("not a type name: '", absl::string_view(type.data(), type.size()), "'"));
        }
        return SyntheticException{std::string(type), std::string(message), EXCEPTION_MECHANISM};
    }

    size_t capture_exception_events(Hub& hub, const Activity& activity, const ContextObject& otel_context) {
        size_t captured = 0;

        for (const auto& marker : activity.GetEvents()) {
            if (marker.Name != semconv::EXCEPTION_EVENT_NAME) {
                continue;
            }

            const AttributeMap marker_attributes(marker.Tags);
            const auto type = marker_attributes.getString(semconv::EXCEPTION_TYPE);
            if (!type) {
                continue;
            }
            const auto message = marker_attributes.getString(semconv::EXCEPTION_MESSAGE);
            const auto stack_trace = marker_attributes.getString(semconv::EXCEPTION_STACKTRACE);

            SyntheticException exception;
            try {
                exception = make_synthetic_exception(*type, message.value_or(""));
            } catch (const std::exception& e) {
                LOG_ERROR("failed to create exception for type : {}, {}", *type, e.what());
                continue;
            }

            ErrorEvent event;
            event.exception = std::move(exception);
            event.timestamp = marker.Timestamp;

            ContextObject context = otel_context;
            context.values[CONTEXT_STACK_TRACE] = stack_trace ? AttributeValue(*stack_trace) : AttributeValue();
            event.contexts[CONTEXT_OTEL] = std::move(context);

            const auto trace_id = activity.GetTraceId();
            const auto span_id = activity.GetSpanId();
            const auto parent_span_id = activity.GetParentSpanId();
            hub.CaptureEvent(event, [&](Scope& scope) {
                auto& trace = scope.GetTraceContext();
                trace.span_id = span_id;
                trace.parent_span_id = parent_span_id;
                trace.trace_id = trace_id;
            });
            captured++;
        }

        return captured;
    }

}  // namespace tracebridge
