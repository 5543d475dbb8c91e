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

#include <utility>
#include <vector>

#include "logging.h"
#include "utility.h"
#include "registry.h"

namespace tracebridge {

    SpanPtr MappedSpan::span() const {
        if (const auto* root = std::get_if<RootTransactionEntry>(&entry)) {
            return root->transaction;
        }
        return std::get<ChildSpanEntry>(entry).span;
    }

    TransactionPtr MappedSpan::transaction() const {
        if (const auto* root = std::get_if<RootTransactionEntry>(&entry)) {
            return root->transaction;
        }
        return nullptr;
    }

    MappedSpan make_child_entry(SpanPtr span, const ActivityPtr& activity) {
        return MappedSpan{ChildSpanEntry{std::move(span)}, activity};
    }

    MappedSpan make_root_entry(TransactionPtr transaction, const ActivityPtr& activity) {
        return MappedSpan{RootTransactionEntry{std::move(transaction)}, activity};
    }

    SpanRegistry::SpanRegistry(std::chrono::milliseconds prune_interval) :
        prune_interval_ms_(prune_interval.count()),
        last_pruned_(steady_milli_seconds()) {}

    bool SpanRegistry::insert(SpanId span_id, MappedSpan entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.emplace(span_id.Value, std::move(entry)).second;
    }

    std::optional<MappedSpan> SpanRegistry::get(SpanId span_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto it = map_.find(span_id.Value); it != map_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<MappedSpan> SpanRegistry::remove(SpanId span_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = map_.find(span_id.Value);
        if (it == map_.end()) {
            return std::nullopt;
        }

        auto removed = std::move(it->second);
        map_.erase(it);
        return removed;
    }

    size_t SpanRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    bool SpanRegistry::needsPruning() {
        auto last_pruned = last_pruned_.load();
        const auto now = steady_milli_seconds();
        if (last_pruned > now - prune_interval_ms_) {
            return false;
        }

        // only the caller that wins the exchange sweeps
        return last_pruned_.compare_exchange_strong(last_pruned, now);
    }

    size_t SpanRegistry::prune(bool force) {
        if (!force && !needsPruning()) {
            return 0;
        }

        std::vector<std::pair<uint64_t, MappedSpan>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(map_.size());
            for (const auto& item : map_) {
                snapshot.emplace_back(item);
            }
        }

        std::vector<std::pair<uint64_t, SpanPtr>> victims;
        for (const auto& [span_id, mapped] : snapshot) {
            const auto activity = mapped.activity.lock();
            if (!activity || (!activity->IsRecorded() && !activity->IsAllDataRequested())) {
                victims.emplace_back(span_id, mapped.span());
            }
        }

        size_t removed = 0;
        if (!victims.empty()) {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [span_id, span] : victims) {
                // an entry re-registered under the same id since the snapshot is kept
                if (const auto it = map_.find(span_id); it != map_.end() && it->second.span() == span) {
                    map_.erase(it);
                    removed++;
                }
            }
        }

        if (removed > 0) {
            LOG_DEBUG("pruned {} filtered spans", removed);
        }
        return removed;
    }

}  // namespace tracebridge
