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

#include <algorithm>
#include <cctype>
#include <random>

#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "utility.h"

namespace tracebridge {

    namespace {
        std::mt19937_64& rand_source() {
            static thread_local std::mt19937_64 source{std::random_device()()};
            return source;
        }

        uint64_t non_zero_random() {
            uint64_t value = 0;
            while (value == 0) {
                value = rand_source()();
            }
            return value;
        }
    }

    SpanId generate_span_id() {
        return SpanId{non_zero_random()};
    }

    TraceId generate_trace_id() {
        return TraceId{rand_source()(), non_zero_random()};
    }

    std::string generate_event_id() {
        return absl::StrFormat("%016x%016x", non_zero_random(), non_zero_random());
    }

    int64_t steady_milli_seconds() {
        const auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }

    namespace {
        struct char_iequal {
            bool operator()(unsigned char c1, unsigned char c2) const {
                return std::toupper(c1) == std::toupper(c2);
            }
        };
    }

    bool compare_string(std::string_view str1, std::string_view str2) {
        if (str1.size() != str2.size()) {
            return false;
        }
        return std::equal(str1.begin(), str1.end(), str2.begin(), char_iequal());
    }

    namespace {
        template<typename T, typename ConversionFunc>
        std::optional<T> safe_string_convert(std::string_view str, ConversionFunc&& func) {
            T result{};
            if (func(absl::string_view(str.data(), str.size()), &result)) {
                return result;
            }
            return std::nullopt;
        }
    }

    std::optional<int> stoi_(std::string_view str) {
        return safe_string_convert<int>(str, [](absl::string_view s, int* out) {
            return absl::SimpleAtoi(s, out);
        });
    }

    std::optional<double> stod_(std::string_view str) {
        return safe_string_convert<double>(str, [](absl::string_view s, double* out) {
            return absl::SimpleAtod(s, out);
        });
    }

    std::optional<bool> stob_(std::string_view str) {
        return safe_string_convert<bool>(str, [](absl::string_view s, bool* out) {
            return absl::SimpleAtob(s, out);
        });
    }

}
