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

#include "attributes.h"

namespace tracebridge {

    AttributeMap::AttributeMap(const Attributes& attributes) {
        for (const auto& [key, value] : attributes) {
            dict_[key] = value;
        }
    }

    bool AttributeMap::contains(std::string_view key) const {
        return get(key) != nullptr;
    }

    const AttributeValue* AttributeMap::get(std::string_view key) const {
        if (const auto it = dict_.find(std::string(key)); it != dict_.end()) {
            return &it->second;
        }
        return nullptr;
    }

    namespace {
        template<typename T>
        std::optional<T> get_typed(const AttributeValue* value) {
            if (value == nullptr) {
                return std::nullopt;
            }
            if (const auto* typed = std::get_if<T>(value)) {
                return *typed;
            }
            return std::nullopt;
        }
    }

    std::optional<std::string> AttributeMap::getString(std::string_view key) const {
        return get_typed<std::string>(get(key));
    }

    std::optional<int64_t> AttributeMap::getInt(std::string_view key) const {
        return get_typed<int64_t>(get(key));
    }

    std::string to_string(const AttributeValue& value) {
        struct Visitor {
            std::string operator()(std::monostate) const { return "null"; }
            std::string operator()(bool v) const { return v ? "true" : "false"; }
            std::string operator()(int64_t v) const { return absl::StrCat(v); }
            std::string operator()(double v) const { return absl::StrCat(v); }
            std::string operator()(const std::string& v) const { return v; }
        };
        return std::visit(Visitor{}, value);
    }

}
