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

#include <map>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"

#include "logging.h"
#include "utility.h"
#include "baggage.h"

namespace tracebridge {

    BaggageHeader BaggageHeader::parse(std::string_view header) {
        std::vector<std::pair<std::string, std::string>> members;

        for (absl::string_view member : absl::StrSplit(absl::string_view(header.data(), header.size()),
                                                       ',', absl::SkipWhitespace())) {
            const absl::string_view key_value = member.substr(0, member.find(';'));
            std::vector<absl::string_view> kv = absl::StrSplit(key_value, absl::MaxSplits('=', 1));
            if (kv.size() != 2) {
                continue;
            }

            const auto key = absl::StripAsciiWhitespace(kv[0]);
            if (key.empty()) {
                continue;
            }
            members.emplace_back(std::string(key), std::string(absl::StripAsciiWhitespace(kv[1])));
        }

        return BaggageHeader(std::move(members));
    }

    void AddBaggageHeader(Activity& activity, std::string_view header) {
        for (const auto& [key, value] : BaggageHeader::parse(header).members()) {
            activity.AddBaggage(key, value);
        }
    }

    std::optional<DynamicSamplingContext> BaggageHeader::createDynamicSamplingContext() const {
        std::map<std::string, std::string> items;
        for (const auto& [key, value] : members_) {
            if (absl::StartsWith(key, BAGGAGE_SENTRY_PREFIX)) {
                items[key.substr(std::char_traits<char>::length(BAGGAGE_SENTRY_PREFIX))] = value;
            }
        }

        const auto trace_id = items.find(dsc_key::TRACE_ID);
        const auto public_key = items.find(dsc_key::PUBLIC_KEY);
        if (trace_id == items.end() || trace_id->second.empty() ||
            public_key == items.end() || public_key->second.empty()) {
            return std::nullopt;
        }

        if (const auto it = items.find(dsc_key::SAMPLE_RATE); it != items.end()) {
            const auto rate = stod_(it->second);
            if (!rate.has_value() || *rate < 0.0 || *rate > 1.0) {
                LOG_DEBUG("invalid sample rate in baggage = {}", it->second);
                return std::nullopt;
            }
        }

        if (const auto it = items.find(dsc_key::SAMPLED); it != items.end()) {
            if (it->second != "true" && it->second != "false") {
                LOG_DEBUG("invalid sampled flag in baggage = {}", it->second);
                return std::nullopt;
            }
        }

        return DynamicSamplingContext(std::move(items));
    }

}
