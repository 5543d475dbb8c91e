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

#include "noop.h"
#include "utility.h"
#include "span.h"

namespace tracebridge {

    std::string_view to_string(SpanStatus status) {
        switch (status) {
            case SPAN_STATUS_OK: return "ok";
            case SPAN_STATUS_CANCELLED: return "cancelled";
            case SPAN_STATUS_UNKNOWN_ERROR: return "unknown_error";
            case SPAN_STATUS_INVALID_ARGUMENT: return "invalid_argument";
            case SPAN_STATUS_DEADLINE_EXCEEDED: return "deadline_exceeded";
            case SPAN_STATUS_NOT_FOUND: return "not_found";
            case SPAN_STATUS_ALREADY_EXISTS: return "already_exists";
            case SPAN_STATUS_PERMISSION_DENIED: return "permission_denied";
            case SPAN_STATUS_RESOURCE_EXHAUSTED: return "resource_exhausted";
            case SPAN_STATUS_FAILED_PRECONDITION: return "failed_precondition";
            case SPAN_STATUS_ABORTED: return "aborted";
            case SPAN_STATUS_OUT_OF_RANGE: return "out_of_range";
            case SPAN_STATUS_UNIMPLEMENTED: return "unimplemented";
            case SPAN_STATUS_INTERNAL_ERROR: return "internal_error";
            case SPAN_STATUS_UNAVAILABLE: return "unavailable";
            case SPAN_STATUS_DATA_LOSS: return "data_loss";
            case SPAN_STATUS_UNAUTHENTICATED: return "unauthenticated";
        }
        return "unknown_error";
    }

    std::string_view to_string(TransactionNameSource source) {
        switch (source) {
            case NAME_SOURCE_CUSTOM: return "custom";
            case NAME_SOURCE_URL: return "url";
            case NAME_SOURCE_ROUTE: return "route";
            case NAME_SOURCE_TASK: return "task";
        }
        return "custom";
    }

    std::string_view to_string(ActivityKind kind) {
        switch (kind) {
            case ACTIVITY_KIND_INTERNAL: return "Internal";
            case ACTIVITY_KIND_SERVER: return "Server";
            case ACTIVITY_KIND_CLIENT: return "Client";
            case ACTIVITY_KIND_PRODUCER: return "Producer";
            case ACTIVITY_KIND_CONSUMER: return "Consumer";
        }
        return "Internal";
    }

    SpanData::SpanData(TraceId trace_id, SpanId span_id, SpanId parent_span_id, bool sampled,
                       std::string_view operation, std::string_view description) :
        trace_id_(trace_id),
        span_id_(span_id),
        parent_span_id_(parent_span_id),
        sampled_(sampled),
        operation_(operation),
        description_(description),
        start_time_(std::chrono::system_clock::now()),
        backend_request_(false),
        finished_(false) {}

    std::string SpanData::getOperation() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return operation_;
    }

    void SpanData::setOperation(std::string_view operation) {
        std::lock_guard<std::mutex> lock(mutex_);
        operation_ = operation;
    }

    std::string SpanData::getDescription() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return description_;
    }

    void SpanData::setDescription(std::string_view description) {
        std::lock_guard<std::mutex> lock(mutex_);
        description_ = description;
    }

    TimePoint SpanData::getStartTime() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return start_time_;
    }

    void SpanData::setStartTime(TimePoint start_time) {
        std::lock_guard<std::mutex> lock(mutex_);
        start_time_ = start_time;
    }

    std::optional<TimePoint> SpanData::getEndTime() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return end_time_;
    }

    void SpanData::setEndTime(TimePoint end_time) {
        std::lock_guard<std::mutex> lock(mutex_);
        end_time_ = end_time;
    }

    std::optional<SpanStatus> SpanData::getStatus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    void SpanData::setStatus(SpanStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }

    void SpanData::setExtra(std::string_view key, AttributeValue value) {
        std::lock_guard<std::mutex> lock(mutex_);
        extras_[std::string(key)] = std::move(value);
    }

    AttributeDict SpanData::getExtras() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return extras_;
    }

    void SpanData::setFiltered(std::function<bool()> predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        filtered_ = std::move(predicate);
    }

    bool SpanData::isFiltered() const {
        std::function<bool()> predicate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            predicate = filtered_;
        }
        return predicate ? predicate() : false;
    }

    void SpanData::setBackendRequest(bool backend_request) {
        std::lock_guard<std::mutex> lock(mutex_);
        backend_request_ = backend_request;
    }

    bool SpanData::isBackendRequest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return backend_request_;
    }

    bool SpanData::finish(std::optional<SpanStatus> status, std::exception_ptr exception) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            return false;
        }

        finished_ = true;
        if (!end_time_) {
            end_time_ = std::chrono::system_clock::now();
        }
        if (status) {
            status_ = status;
        }
        if (exception) {
            exception_ = std::move(exception);
        }
        return true;
    }

    bool SpanData::isFinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

    std::exception_ptr SpanData::getException() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return exception_;
    }

    SpanImpl::SpanImpl(std::weak_ptr<TransactionImpl> owner, const SpanContext& context, bool sampled) :
        SpanBase<Span>(context.trace_id, context.span_id, context.parent_span_id, sampled,
                       context.operation, context.description),
        owner_(std::move(owner)) {}

    SpanPtr SpanImpl::StartChild(const SpanContext& context) try {
        const auto owner = owner_.lock();
        if (!owner) {
            LOG_WARN("transaction of span {} is gone", GetSpanId().ToString());
            return noopSpan(context);
        }

        SpanContext child_context = context;
        if (!child_context.parent_span_id.IsValid()) {
            child_context.parent_span_id = GetSpanId();
        }
        return owner->StartChild(child_context);
    } catch (const std::exception& e) {
        LOG_ERROR("start child span exception = {}", e.what());
        return noopSpan(context);
    }

    TransactionImpl::TransactionImpl(HubService* hub, const TransactionContext& context, bool sampled,
                                     std::optional<DynamicSamplingContext> dynamic_sampling_context) :
        SpanBase<Transaction>(context.trace_id.IsValid() ? context.trace_id : generate_trace_id(),
                              context.span_id.IsValid() ? context.span_id : generate_span_id(),
                              context.parent_span_id, sampled, context.operation, context.description),
        hub_(hub),
        dsc_(std::move(dynamic_sampling_context)),
        name_(context.name),
        name_source_(NAME_SOURCE_CUSTOM) {}

    SpanPtr TransactionImpl::StartChild(const SpanContext& context) try {
        SpanContext child_context = context;
        if (!child_context.trace_id.IsValid()) {
            child_context.trace_id = GetTraceId();
        }
        if (!child_context.parent_span_id.IsValid()) {
            child_context.parent_span_id = GetSpanId();
        }

        if (IsFinished()) {
            LOG_WARN("span is already finished");
            return noopSpan(child_context);
        }

        if (!child_context.span_id.IsValid()) {
            child_context.span_id = generate_span_id();
        }

        auto child = std::make_shared<SpanImpl>(weak_from_this(), child_context, IsSampled());
        std::lock_guard<std::mutex> lock(mutex_);
        children_.push_back(child);
        return child;
    } catch (const std::exception& e) {
        LOG_ERROR("start child span exception = {}", e.what());
        return noopSpan(context);
    }

    std::string TransactionImpl::GetName() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return name_;
    }

    void TransactionImpl::SetName(std::string_view name) {
        std::lock_guard<std::mutex> lock(mutex_);
        name_ = name;
    }

    TransactionNameSource TransactionImpl::GetNameSource() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return name_source_;
    }

    void TransactionImpl::SetNameSource(TransactionNameSource source) {
        std::lock_guard<std::mutex> lock(mutex_);
        name_source_ = source;
    }

    void TransactionImpl::SetContext(std::string_view key, ContextObject context) {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts_[std::string(key)] = std::move(context);
    }

    Contexts TransactionImpl::GetContexts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contexts_;
    }

    std::vector<SpanPtr> TransactionImpl::getChildren() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return children_;
    }

    void TransactionImpl::onFinished() try {
        if (hub_ == nullptr) {
            return;
        }
        if (hub_->isExiting()) {
            LOG_DEBUG("hub is exiting. drop transaction: {}", GetSpanId().ToString());
            return;
        }
        hub_->recordTransaction(shared_from_this());
    } catch (const std::exception& e) {
        LOG_ERROR("record transaction exception = {}", e.what());
    }

}  // namespace tracebridge
