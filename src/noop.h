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

#include "tracebridge/tracer.h"

namespace tracebridge {

    SpanPtr noopSpan();
    /// @brief Returns a no-op span that still reports the identity of `context`.
    SpanPtr noopSpan(const SpanContext& context);
    TransactionPtr noopTransaction();
    /// @brief Returns a no-op transaction that still reports the identity of `context`.
    TransactionPtr noopTransaction(const TransactionContext& context);
    HubPtr noopHub();

    template<typename Interface>
    class NoopSpanBase : public Interface {
    public:
        NoopSpanBase() : trace_id_{}, span_id_{}, parent_span_id_{} {}
        NoopSpanBase(TraceId trace_id, SpanId span_id, SpanId parent_span_id)
            : trace_id_(trace_id), span_id_(span_id), parent_span_id_(parent_span_id) {}
        ~NoopSpanBase() override {}

        SpanPtr StartChild(const SpanContext& context) override {
            SpanContext child_context = context;
            if (!child_context.trace_id.IsValid()) {
                child_context.trace_id = trace_id_;
            }
            if (!child_context.parent_span_id.IsValid()) {
                child_context.parent_span_id = span_id_;
            }
            return noopSpan(child_context);
        }

        TraceId GetTraceId() const override { return trace_id_; }
        SpanId GetSpanId() const override { return span_id_; }
        SpanId GetParentSpanId() const override { return parent_span_id_; }
        bool IsSampled() const override { return false; }

        std::string GetOperation() const override { return ""; }
        void SetOperation(std::string_view operation) override {}
        std::string GetDescription() const override { return ""; }
        void SetDescription(std::string_view description) override {}

        TimePoint GetStartTimestamp() const override { return TimePoint{}; }
        void SetStartTimestamp(TimePoint timestamp) override {}
        std::optional<TimePoint> GetEndTimestamp() const override { return std::nullopt; }
        void SetEndTimestamp(TimePoint timestamp) override {}

        std::optional<SpanStatus> GetStatus() const override { return std::nullopt; }
        void SetStatus(SpanStatus status) override {}

        void SetExtra(std::string_view key, AttributeValue value) override {}
        AttributeDict GetExtras() const override { return {}; }

        void SetFiltered(std::function<bool()> predicate) override {}
        bool IsFiltered() const override { return false; }
        void SetBackendRequest(bool backend_request) override {}
        bool IsBackendRequest() const override { return false; }

        void Finish() override {}
        void Finish(SpanStatus status) override {}
        void Finish(std::exception_ptr exception) override {}
        bool IsFinished() const override { return false; }
        std::exception_ptr GetException() const override { return nullptr; }

    protected:
        TraceId trace_id_;
        SpanId span_id_;
        SpanId parent_span_id_;
    };

    class NoopSpan final : public NoopSpanBase<Span> {
    public:
        NoopSpan() = default;
        explicit NoopSpan(const SpanContext& context)
            : NoopSpanBase<Span>(context.trace_id, context.span_id, context.parent_span_id) {}
        ~NoopSpan() override {}
    };

    class NoopTransaction final : public NoopSpanBase<Transaction> {
    public:
        NoopTransaction() = default;
        explicit NoopTransaction(const TransactionContext& context)
            : NoopSpanBase<Transaction>(context.trace_id, context.span_id, context.parent_span_id) {}
        ~NoopTransaction() override {}

        std::string GetName() const override { return ""; }
        void SetName(std::string_view name) override {}
        TransactionNameSource GetNameSource() const override { return NAME_SOURCE_CUSTOM; }
        void SetNameSource(TransactionNameSource source) override {}

        void SetContext(std::string_view key, ContextObject context) override {}
        Contexts GetContexts() const override { return {}; }
        std::optional<DynamicSamplingContext> GetDynamicSamplingContext() const override { return std::nullopt; }
    };

    class NoopHub final : public Hub {
    public:
        NoopHub() {}
        ~NoopHub() override {}

        TransactionPtr StartTransaction(const TransactionContext& context,
                                        const SamplingContext& custom_sampling_context,
                                        std::optional<DynamicSamplingContext> dynamic_sampling_context) override {
            return noopTransaction(context);
        }
        void ConfigureScope(const std::function<void(Scope&)>& configure) override {}
        void RestoreScope(const ScopePtr& scope) override {}
        ScopePtr GetScope() const override { return std::make_shared<Scope>(); }
        std::string CaptureEvent(const ErrorEvent& event, const std::function<void(Scope&)>& configure) override {
            return "";
        }

        bool Enable() override { return false; }
        void Shutdown() override {}
    };

    class Noop {
    public:
        Noop() :
            noop_hub_(std::make_shared<NoopHub>()),
            noop_span_(std::make_shared<NoopSpan>()),
            noop_transaction_(std::make_shared<NoopTransaction>())
        {}

        HubPtr hub() const { return noop_hub_; }
        SpanPtr span() const { return noop_span_; }
        TransactionPtr transaction() const { return noop_transaction_; }

    private:
        Noop(const Noop&) = delete;
        Noop& operator=(const Noop&) = delete;
        Noop(Noop&&) = delete;
        Noop& operator=(Noop&&) = delete;

        HubPtr noop_hub_;
        SpanPtr noop_span_;
        TransactionPtr noop_transaction_;
    };
}
