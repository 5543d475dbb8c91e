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

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tracebridge/tracer.h"
#include "hub_service.h"
#include "logging.h"

namespace tracebridge {

    /**
     * @brief Holds the mutable state of a span until its transaction is handed to the transport.
     *
     * Identity is fixed at construction. Every other field may be read and written from
     * any thread, so access goes through the internal mutex.
     */
    class SpanData final {
    public:
        SpanData(TraceId trace_id, SpanId span_id, SpanId parent_span_id, bool sampled,
                 std::string_view operation, std::string_view description);
        ~SpanData() = default;

        TraceId getTraceId() const { return trace_id_; }
        SpanId getSpanId() const { return span_id_; }
        SpanId getParentSpanId() const { return parent_span_id_; }
        bool isSampled() const { return sampled_; }

        std::string getOperation() const;
        void setOperation(std::string_view operation);
        std::string getDescription() const;
        void setDescription(std::string_view description);

        TimePoint getStartTime() const;
        void setStartTime(TimePoint start_time);
        std::optional<TimePoint> getEndTime() const;
        void setEndTime(TimePoint end_time);

        std::optional<SpanStatus> getStatus() const;
        void setStatus(SpanStatus status);

        void setExtra(std::string_view key, AttributeValue value);
        AttributeDict getExtras() const;

        void setFiltered(std::function<bool()> predicate);
        /// @brief Evaluates the filter predicate outside the lock.
        bool isFiltered() const;

        void setBackendRequest(bool backend_request);
        bool isBackendRequest() const;

        /**
         * @brief Marks the span finished.
         *
         * Keeps an explicit end timestamp, otherwise stamps "now". The status only
         * replaces the current one when provided.
         *
         * @return `false` when the span was already finished.
         */
        bool finish(std::optional<SpanStatus> status, std::exception_ptr exception);
        bool isFinished() const;
        std::exception_ptr getException() const;

    private:
        const TraceId trace_id_;
        const SpanId span_id_;
        const SpanId parent_span_id_;
        const bool sampled_;

        mutable std::mutex mutex_;
        std::string operation_;
        std::string description_;
        TimePoint start_time_;
        std::optional<TimePoint> end_time_;
        std::optional<SpanStatus> status_;
        AttributeDict extras_;
        std::function<bool()> filtered_;
        bool backend_request_;
        bool finished_;
        std::exception_ptr exception_;
    };

    /**
     * @brief Implements the `Span` surface shared by child spans and transactions on top of `SpanData`.
     *
     * @tparam Interface `Span` or `Transaction`.
     */
    template<typename Interface>
    class SpanBase : public Interface {
    public:
        SpanBase(TraceId trace_id, SpanId span_id, SpanId parent_span_id, bool sampled,
                 std::string_view operation, std::string_view description)
            : data_(trace_id, span_id, parent_span_id, sampled, operation, description) {}
        ~SpanBase() override = default;

        TraceId GetTraceId() const override { return data_.getTraceId(); }
        SpanId GetSpanId() const override { return data_.getSpanId(); }
        SpanId GetParentSpanId() const override { return data_.getParentSpanId(); }
        bool IsSampled() const override { return data_.isSampled(); }

        std::string GetOperation() const override { return data_.getOperation(); }
        void SetOperation(std::string_view operation) override { data_.setOperation(operation); }
        std::string GetDescription() const override { return data_.getDescription(); }
        void SetDescription(std::string_view description) override { data_.setDescription(description); }

        TimePoint GetStartTimestamp() const override { return data_.getStartTime(); }
        void SetStartTimestamp(TimePoint timestamp) override { data_.setStartTime(timestamp); }
        std::optional<TimePoint> GetEndTimestamp() const override { return data_.getEndTime(); }
        void SetEndTimestamp(TimePoint timestamp) override { data_.setEndTime(timestamp); }

        std::optional<SpanStatus> GetStatus() const override { return data_.getStatus(); }
        void SetStatus(SpanStatus status) override { data_.setStatus(status); }

        void SetExtra(std::string_view key, AttributeValue value) override { data_.setExtra(key, std::move(value)); }
        AttributeDict GetExtras() const override { return data_.getExtras(); }

        void SetFiltered(std::function<bool()> predicate) override { data_.setFiltered(std::move(predicate)); }
        bool IsFiltered() const override { return data_.isFiltered(); }

        void SetBackendRequest(bool backend_request) override { data_.setBackendRequest(backend_request); }
        bool IsBackendRequest() const override { return data_.isBackendRequest(); }

        void Finish() override {
            const auto status = data_.getStatus();
            finish(status ? *status : SPAN_STATUS_OK, nullptr);
        }
        void Finish(SpanStatus status) override { finish(status, nullptr); }
        void Finish(std::exception_ptr exception) override { finish(SPAN_STATUS_INTERNAL_ERROR, std::move(exception)); }
        bool IsFinished() const override { return data_.isFinished(); }
        std::exception_ptr GetException() const override { return data_.getException(); }

    protected:
        /// @brief Called once, after the span transitioned to finished.
        virtual void onFinished() {}

        SpanData data_;

    private:
        void finish(SpanStatus status, std::exception_ptr exception) {
            if (!data_.finish(status, std::move(exception))) {
                LOG_WARN("span is already finished");
                return;
            }
            onFinished();
        }
    };

    class TransactionImpl;

    /**
     * @brief Child span owned by a transaction.
     */
    class SpanImpl final : public SpanBase<Span> {
    public:
        SpanImpl(std::weak_ptr<TransactionImpl> owner, const SpanContext& context, bool sampled);
        ~SpanImpl() override = default;

        /// @brief Starts a sibling-tree child through the owning transaction.
        SpanPtr StartChild(const SpanContext& context) override;

    private:
        std::weak_ptr<TransactionImpl> owner_;
    };

    /**
     * @brief Root span of a trace. Owns its child spans and reports itself to the hub on finish.
     */
    class TransactionImpl final : public SpanBase<Transaction>, public std::enable_shared_from_this<TransactionImpl> {
    public:
        TransactionImpl(HubService* hub, const TransactionContext& context, bool sampled,
                        std::optional<DynamicSamplingContext> dynamic_sampling_context);
        ~TransactionImpl() override = default;

        SpanPtr StartChild(const SpanContext& context) override;

        std::string GetName() const override;
        void SetName(std::string_view name) override;
        TransactionNameSource GetNameSource() const override;
        void SetNameSource(TransactionNameSource source) override;

        void SetContext(std::string_view key, ContextObject context) override;
        Contexts GetContexts() const override;

        std::optional<DynamicSamplingContext> GetDynamicSamplingContext() const override { return dsc_; }

        /// @brief Returns a snapshot of the child spans started so far.
        std::vector<SpanPtr> getChildren() const;

    protected:
        void onFinished() override;

    private:
        HubService* hub_;
        const std::optional<DynamicSamplingContext> dsc_;

        mutable std::mutex mutex_;
        std::string name_;
        TransactionNameSource name_source_;
        Contexts contexts_;
        std::vector<SpanPtr> children_;
    };

}  // namespace tracebridge
