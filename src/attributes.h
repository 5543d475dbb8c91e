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

#include "tracebridge/tracer.h"

namespace tracebridge {

    /**
     * @brief Normalized, read-only view of an activity's attribute list.
     *
     * Duplicate keys collapse to the last value. Typed getters only succeed when the
     * stored value has exactly the requested type; a string "404" is not an integer.
     */
    class AttributeMap {
    public:
        AttributeMap() = default;
        explicit AttributeMap(const Attributes& attributes);

        bool contains(std::string_view key) const;
        const AttributeValue* get(std::string_view key) const;

        std::optional<std::string> getString(std::string_view key) const;
        std::optional<int64_t> getInt(std::string_view key) const;

        size_t size() const { return dict_.size(); }
        bool empty() const { return dict_.empty(); }
        const AttributeDict& dict() const { return dict_; }

    private:
        AttributeDict dict_;
    };

    /// @brief Renders an attribute value for log output.
    std::string to_string(const AttributeValue& value);

}
