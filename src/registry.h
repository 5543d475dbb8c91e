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

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <variant>

#include "tracebridge/tracer.h"

namespace tracebridge {

    /// @brief Registry payload for an activity whose parent was registered.
    struct ChildSpanEntry {
        SpanPtr span;
    };

    /// @brief Registry payload for an activity that started a new trace root.
    struct RootTransactionEntry {
        TransactionPtr transaction;
    };

    /**
     * @brief Span mapped to an in-flight activity.
     *
     * The child/root classification is decided when the entry is created and never changes.
     */
    struct MappedSpan {
        std::variant<ChildSpanEntry, RootTransactionEntry> entry;
        std::weak_ptr<Activity> activity;

        bool isRoot() const { return std::holds_alternative<RootTransactionEntry>(entry); }
        SpanPtr span() const;
        /// @brief Returns the transaction for root entries, `nullptr` for child entries.
        TransactionPtr transaction() const;
    };

    MappedSpan make_child_entry(SpanPtr span, const ActivityPtr& activity);
    MappedSpan make_root_entry(TransactionPtr transaction, const ActivityPtr& activity);

    /**
     * @brief Thread-safe map from activity span id to the span created for it.
     *
     * Also rate-limits the pruning sweep that drops entries whose activity was discarded
     * before it could end. The sweep is gated by a compare-and-swap on the time of the
     * last run, so concurrent callers never sweep twice in one interval.
     */
    class SpanRegistry {
    public:
        explicit SpanRegistry(std::chrono::milliseconds prune_interval);
        ~SpanRegistry() = default;

        SpanRegistry(const SpanRegistry&) = delete;
        SpanRegistry& operator=(const SpanRegistry&) = delete;
        SpanRegistry(SpanRegistry&&) = delete;
        SpanRegistry& operator=(SpanRegistry&&) = delete;

        /**
         * @brief Inserts the entry unless one already exists for `span_id`.
         *
         * @return `true` if the entry was inserted.
         */
        bool insert(SpanId span_id, MappedSpan entry);
        std::optional<MappedSpan> get(SpanId span_id) const;
        /// @brief Removes and returns the entry. Removing an absent key is a no-op.
        std::optional<MappedSpan> remove(SpanId span_id);
        size_t size() const;

        /**
         * @brief Claims the next pruning sweep.
         *
         * @return `true` for exactly one caller once the interval has elapsed since the last sweep.
         */
        bool needsPruning();
        /**
         * @brief Removes entries whose activity is neither recorded nor requesting all data.
         *
         * Entries whose activity no longer exists are removed as well since they can never
         * receive an end notification.
         *
         * @param force Skip the interval check.
         * @return Number of removed entries.
         */
        size_t prune(bool force = false);

    private:
        mutable std::mutex mutex_;
        std::unordered_map<uint64_t, MappedSpan> map_;
        const int64_t prune_interval_ms_;
        std::atomic<int64_t> last_pruned_;
    };

}  // namespace tracebridge
