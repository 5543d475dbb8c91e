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

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tracebridge/tracer.h"

namespace tracebridge {

    constexpr const char* BAGGAGE_SENTRY_PREFIX = "sentry-";

    namespace dsc_key {
        constexpr const char* TRACE_ID = "trace_id";
        constexpr const char* PUBLIC_KEY = "public_key";
        constexpr const char* SAMPLE_RATE = "sample_rate";
        constexpr const char* SAMPLED = "sampled";
    }

    /**
     * @brief Ordered list of baggage members propagated with a trace.
     */
    class BaggageHeader {
    public:
        BaggageHeader() = default;
        explicit BaggageHeader(std::vector<std::pair<std::string, std::string>> members)
            : members_(std::move(members)) {}

        /**
         * @brief Parses a W3C `baggage` header value (`k1=v1,k2=v2;prop`).
         *
         * Members without `=` are skipped. Member properties after `;` are dropped.
         */
        static BaggageHeader parse(std::string_view header);

        const std::vector<std::pair<std::string, std::string>>& members() const { return members_; }

        /**
         * @brief Builds the dynamic sampling context from the `sentry-` prefixed members.
         *
         * @return The context, or `std::nullopt` when mandatory members are missing or invalid.
         */
        std::optional<DynamicSamplingContext> createDynamicSamplingContext() const;

    private:
        std::vector<std::pair<std::string, std::string>> members_;
    };

}
