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

#include <mutex>

#include "tracebridge/tracer.h"
#include "attributes.h"
#include "hub_service.h"
#include "registry.h"

namespace tracebridge {

    constexpr const char* OTEL_CONTEXT_ATTRIBUTES = "attributes";
    constexpr const char* OTEL_CONTEXT_RESOURCE = "resource";

    /**
     * @brief Maps activity start and end notifications onto transactions and child spans.
     *
     * On start, an activity whose parent is registered becomes a child span of that
     * parent. Any other activity starts a new transaction that is bound to the hub's
     * scope. On end, names, timing, status and error events are derived from the
     * activity's attributes before the span is finished and unregistered.
     *
     * `OnStart` and `OnEnd` may be called concurrently from any thread. No internal lock
     * is held while calling into the hub or user callbacks.
     */
    class ActivitySpanProcessor final : public ActivityListener {
    public:
        /**
         * @throws std::invalid_argument when `hub` is not an initialized hub.
         */
        ActivitySpanProcessor(HubPtr hub, BeforeFinishCallback before_finish,
                              ResourceAttributeResolver resource_resolver);
        ~ActivitySpanProcessor() override = default;

        void OnStart(const ActivityPtr& activity) override;
        void OnEnd(const ActivityPtr& activity) override;
        SpanPtr GetMappedSpan(SpanId span_id) const override;

        /**
         * @brief Drops registry entries of activities that were filtered out after they started.
         *
         * @param force Run even if the pruning interval has not elapsed.
         * @return Number of removed entries.
         */
        size_t pruneFilteredSpans(bool force = false);
        size_t registrySize() const { return registry_.size(); }

    private:
        void startChild(const ActivityPtr& activity, const MappedSpan& parent);
        void startTransaction(const ActivityPtr& activity);
        ContextObject makeOtelContext(const AttributeMap& attributes);
        const AttributeDict& resourceAttributes();

        HubPtr hub_;
        HubService* hub_service_;
        Instrumenter instrumenter_;
        bool callback_status_precedence_;
        BeforeFinishCallback before_finish_;

        ResourceAttributeResolver resource_resolver_;
        std::once_flag resource_once_;
        AttributeDict resource_attributes_;

        SpanRegistry registry_;
    };

}  // namespace tracebridge
