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

#include <stdexcept>

#include "baggage.h"
#include "config.h"
#include "exception_events.h"
#include "logging.h"
#include "resolver.h"
#include "activity_processor.h"

namespace tracebridge {

    static HubService* to_hub_service(const HubPtr& hub) {
        auto* service = dynamic_cast<HubService*>(hub.get());
        if (service == nullptr || service->getConfig() == nullptr) {
            throw std::invalid_argument(
                "the hub has not been initialized. create the hub before creating an activity listener");
        }
        return service;
    }

    static ScopePtr get_saved_scope(const ActivityPtr& activity) {
        for (auto current = activity; current; current = current->GetParent()) {
            if (auto scope = current->GetScope()) {
                return scope;
            }
        }
        return nullptr;
    }

    ActivitySpanProcessor::ActivitySpanProcessor(HubPtr hub, BeforeFinishCallback before_finish,
                                                 ResourceAttributeResolver resource_resolver) :
        hub_(std::move(hub)),
        hub_service_(to_hub_service(hub_)),
        instrumenter_(INSTRUMENTER_OPENTELEMETRY),
        callback_status_precedence_(hub_service_->getConfig()->callbackStatusPrecedence()),
        before_finish_(std::move(before_finish)),
        resource_resolver_(std::move(resource_resolver)),
        registry_(std::chrono::milliseconds(hub_service_->getConfig()->tracing.prune_interval)) {}

    SpanPtr ActivitySpanProcessor::GetMappedSpan(SpanId span_id) const {
        if (const auto mapped = registry_.get(span_id)) {
            return mapped->span();
        }
        return nullptr;
    }

    void ActivitySpanProcessor::OnStart(const ActivityPtr& activity) try {
        if (!activity) {
            return;
        }

        if (registry_.get(activity->GetSpanId())) {
            LOG_WARN("activity {} is already registered", activity->GetSpanId().ToString());
            return;
        }

        const auto parent_span_id = activity->GetParentSpanId();
        std::optional<MappedSpan> parent;
        if (parent_span_id.IsValid()) {
            parent = registry_.get(parent_span_id);
        }

        if (parent) {
            startChild(activity, *parent);
        } else {
            startTransaction(activity);
        }

        registry_.prune();
    } catch (const std::exception& e) {
        LOG_ERROR("activity start exception = {}", e.what());
    } catch (...) {
        LOG_ERROR("activity start unknown exception");
    }

    void ActivitySpanProcessor::startChild(const ActivityPtr& activity, const MappedSpan& parent) {
        SpanContext context;
        context.operation = activity->GetOperationName();
        context.span_id = activity->GetSpanId();
        context.parent_span_id = activity->GetParentSpanId();
        context.trace_id = activity->GetTraceId();
        context.description = activity->GetDisplayName();
        context.instrumenter = instrumenter_;

        auto span = parent.span()->StartChild(context);
        span->SetStartTimestamp(activity->GetStartTime());
        activity->BindSpan(span);

        std::weak_ptr<Activity> weak_activity = activity;
        span->SetFiltered([weak_activity]() {
            const auto owner = weak_activity.lock();
            return owner && !owner->IsAllDataRequested() && !owner->IsRecorded();
        });

        if (!registry_.insert(activity->GetSpanId(), make_child_entry(span, activity))) {
            LOG_WARN("activity {} is already registered", activity->GetSpanId().ToString());
        }
    }

    void ActivitySpanProcessor::startTransaction(const ActivityPtr& activity) {
        std::optional<bool> sampled;
        if (activity->HasRemoteParent()) {
            sampled = activity->IsRecorded();
        }

        TransactionContext context;
        context.name = activity->GetDisplayName();
        context.operation = activity->GetOperationName();
        context.span_id = activity->GetSpanId();
        context.parent_span_id = activity->GetParentSpanId();
        context.trace_id = activity->GetTraceId();
        context.description = activity->GetDisplayName();
        context.sampled = sampled;
        context.parent_sampled = sampled;
        context.instrumenter = instrumenter_;

        const BaggageHeader baggage(activity->GetBaggage());
        auto transaction = hub_->StartTransaction(context, SamplingContext{},
                                                  baggage.createDynamicSamplingContext());
        transaction->SetStartTimestamp(activity->GetStartTime());
        hub_->ConfigureScope([&transaction](Scope& scope) {
            scope.SetTransaction(transaction);
        });
        activity->BindSpan(transaction);

        if (!registry_.insert(activity->GetSpanId(), make_root_entry(transaction, activity))) {
            LOG_WARN("activity {} is already registered", activity->GetSpanId().ToString());
        }
    }

    void ActivitySpanProcessor::OnEnd(const ActivityPtr& activity) try {
        if (!activity) {
            return;
        }

        const auto span_id = activity->GetSpanId();
        const AttributeMap attributes(activity->GetTags());

        auto url = attributes.getString(semconv::URL_FULL);
        if (!url) {
            url = attributes.getString(semconv::HTTP_URL);
        }
        if (url && !url->empty() && hub_service_->isBackendRequest(*url)) {
            LOG_DEBUG("ignoring activity {} for backend request", span_id.ToString());
            if (const auto removed = registry_.remove(span_id)) {
                removed->span()->SetBackendRequest(true);
            }
            return;
        }

        const auto mapped = registry_.get(span_id);
        if (!mapped) {
            LOG_ERROR("span not found for span id: {}. did OnStart run?", span_id.ToString());
            return;
        }

        const auto span = mapped->span();
        const auto description = resolve_description(*activity, attributes);
        span->SetOperation(description.operation);
        span->SetDescription(description.description);

        const auto end_time = activity->GetStartTime() + activity->GetDuration();
        if (const auto transaction = mapped->transaction()) {
            transaction->SetName(description.description);
            transaction->SetNameSource(description.source);
            transaction->SetEndTimestamp(end_time);
            transaction->SetContext(CONTEXT_OTEL, makeOtelContext(attributes));
        } else {
            span->SetEndTimestamp(end_time);
            for (const auto& [key, value] : attributes.dict()) {
                span->SetExtra(key, value);
            }
            span->SetExtra(semconv::OTEL_KIND, std::string(to_string(activity->GetKind())));
        }

        // the scope may have been popped before the activity ended
        if (const auto scope = get_saved_scope(activity)) {
            hub_->RestoreScope(scope);
        }

        capture_exception_events(*hub_, *activity, makeOtelContext(attributes));

        if (before_finish_) {
            try {
                before_finish_(span, *activity);
            } catch (const std::exception& e) {
                LOG_ERROR("before finish callback exception = {}", e.what());
            } catch (...) {
                LOG_ERROR("before finish callback unknown exception");
            }
        }

        if (const auto exception = activity->GetException()) {
            span->Finish(exception);
        } else if (callback_status_precedence_ && span->GetStatus().has_value()) {
            span->Finish();
        } else {
            span->Finish(resolve_status(activity->GetStatus(), attributes));
        }

        registry_.remove(span_id);
        registry_.prune();
    } catch (const std::exception& e) {
        LOG_ERROR("activity end exception = {}", e.what());
        if (activity) {
            registry_.remove(activity->GetSpanId());
        }
    } catch (...) {
        LOG_ERROR("activity end unknown exception");
        if (activity) {
            registry_.remove(activity->GetSpanId());
        }
    }

    size_t ActivitySpanProcessor::pruneFilteredSpans(bool force) {
        return registry_.prune(force);
    }

    ContextObject ActivitySpanProcessor::makeOtelContext(const AttributeMap& attributes) {
        ContextObject context;
        if (!attributes.empty()) {
            context.dicts[OTEL_CONTEXT_ATTRIBUTES] = attributes.dict();
        }
        if (const auto& resource = resourceAttributes(); !resource.empty()) {
            context.dicts[OTEL_CONTEXT_RESOURCE] = resource;
        }
        return context;
    }

    const AttributeDict& ActivitySpanProcessor::resourceAttributes() {
        std::call_once(resource_once_, [this]() {
            if (!resource_resolver_) {
                return;
            }
            try {
                resource_attributes_ = resource_resolver_();
            } catch (const std::exception& e) {
                LOG_ERROR("resource attribute resolver exception = {}", e.what());
            } catch (...) {
                LOG_ERROR("resource attribute resolver unknown exception");
            }
        });
        return resource_attributes_;
    }

    ActivityListenerPtr NewActivityListener(const HubPtr& hub,
                                            BeforeFinishCallback before_finish,
                                            ResourceAttributeResolver resource_resolver) {
        return std::make_shared<ActivitySpanProcessor>(hub, std::move(before_finish), std::move(resource_resolver));
    }

}  // namespace tracebridge
