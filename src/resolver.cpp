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

#include "absl/strings/str_cat.h"

#include "http.h"
#include "resolver.h"

namespace tracebridge {

    static SpanStatus error_status(const AttributeMap& attributes) {
        if (const auto http_code = attributes.getInt(semconv::HTTP_STATUS_CODE)) {
            return span_status_from_http(*http_code);
        }
        if (const auto grpc_code = attributes.getInt(semconv::RPC_GRPC_STATUS_CODE)) {
            return span_status_from_grpc(*grpc_code);
        }
        return SPAN_STATUS_UNKNOWN_ERROR;
    }

    SpanStatus resolve_status(ActivityStatusCode status, const AttributeMap& attributes) {
        if (const auto otel_status = attributes.getString(semconv::OTEL_STATUS_CODE);
            otel_status && *otel_status == semconv::OTEL_STATUS_ERROR) {
            return error_status(attributes);
        }

        switch (status) {
            case ACTIVITY_STATUS_UNSET:
            case ACTIVITY_STATUS_OK:
                return SPAN_STATUS_OK;
            case ACTIVITY_STATUS_ERROR:
                return error_status(attributes);
            default:
                return SPAN_STATUS_UNKNOWN_ERROR;
        }
    }

    SpanDescription resolve_description(const Activity& activity, const AttributeMap& attributes) {
        return resolve_description(activity.GetKind(), activity.GetOperationName(),
                                   activity.GetDisplayName(), attributes);
    }

    SpanDescription resolve_description(ActivityKind kind, std::string_view operation_name,
                                        std::string_view display_name, const AttributeMap& attributes) {
        if (const auto method = attributes.getString(semconv::HTTP_METHOD)) {
            if (kind == ACTIVITY_KIND_CLIENT) {
                return {OP_HTTP_CLIENT, *method, NAME_SOURCE_CUSTOM};
            }
            if (const auto route = attributes.getString(semconv::HTTP_ROUTE)) {
                return {OP_HTTP_SERVER, absl::StrCat(*method, " ", *route), NAME_SOURCE_ROUTE};
            }
            if (const auto target = attributes.getString(semconv::HTTP_TARGET)) {
                const auto source = *target == "/" ? NAME_SOURCE_ROUTE : NAME_SOURCE_URL;
                return {OP_HTTP_SERVER, absl::StrCat(*method, " ", *target), source};
            }
            return {OP_HTTP_SERVER, std::string(display_name), NAME_SOURCE_CUSTOM};
        }

        if (attributes.contains(semconv::DB_SYSTEM)) {
            if (const auto statement = attributes.getString(semconv::DB_STATEMENT)) {
                return {OP_DB, *statement, NAME_SOURCE_TASK};
            }
            return {OP_DB, std::string(display_name), NAME_SOURCE_TASK};
        }

        if (attributes.contains(semconv::RPC_SERVICE)) {
            return {OP_RPC, std::string(display_name), NAME_SOURCE_ROUTE};
        }

        if (attributes.contains(semconv::MESSAGING_SYSTEM)) {
            return {OP_MESSAGE, std::string(display_name), NAME_SOURCE_ROUTE};
        }

        if (const auto trigger = attributes.getString(semconv::FAAS_TRIGGER)) {
            return {*trigger, std::string(display_name), NAME_SOURCE_ROUTE};
        }

        return {std::string(operation_name), std::string(display_name), NAME_SOURCE_CUSTOM};
    }

}
