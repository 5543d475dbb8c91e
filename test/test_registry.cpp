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

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "../src/registry.h"
#include "../src/noop.h"

namespace tracebridge {

class SpanRegistryTest : public ::testing::Test {
protected:
    static ActivityPtr make_activity(uint64_t span_id) {
        return std::make_shared<Activity>("work", TraceId{1, 1}, SpanId{span_id});
    }
};

TEST_F(SpanRegistryTest, InsertGetRemoveTest) {
    SpanRegistry registry(std::chrono::milliseconds(5000));
    auto activity = make_activity(10);
    auto span = std::make_shared<NoopSpan>();

    EXPECT_TRUE(registry.insert(SpanId{10}, make_child_entry(span, activity)));
    EXPECT_EQ(registry.size(), 1);

    auto found = registry.get(SpanId{10});
    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found->isRoot());
    EXPECT_EQ(found->span(), span);
    EXPECT_EQ(found->transaction(), nullptr);

    auto removed = registry.remove(SpanId{10});
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->span(), span);
    EXPECT_EQ(registry.size(), 0);

    EXPECT_FALSE(registry.get(SpanId{10}).has_value());
    EXPECT_FALSE(registry.remove(SpanId{10}).has_value()) << "Second removal finds nothing";
}

TEST_F(SpanRegistryTest, RootEntryTest) {
    SpanRegistry registry(std::chrono::milliseconds(5000));
    auto activity = make_activity(20);
    auto transaction = std::make_shared<NoopTransaction>();

    registry.insert(SpanId{20}, make_root_entry(transaction, activity));

    auto found = registry.get(SpanId{20});
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->isRoot());
    EXPECT_EQ(found->transaction(), transaction);
    EXPECT_EQ(found->span(), transaction);
}

TEST_F(SpanRegistryTest, InsertKeepsExistingEntryTest) {
    SpanRegistry registry(std::chrono::milliseconds(5000));
    auto activity = make_activity(30);
    auto first = std::make_shared<NoopSpan>();
    auto second = std::make_shared<NoopSpan>();

    EXPECT_TRUE(registry.insert(SpanId{30}, make_child_entry(first, activity)));
    EXPECT_FALSE(registry.insert(SpanId{30}, make_child_entry(second, activity)));
    EXPECT_EQ(registry.get(SpanId{30})->span(), first);
}

TEST_F(SpanRegistryTest, NoPruningBeforeIntervalTest) {
    SpanRegistry registry(std::chrono::milliseconds(5000));

    EXPECT_FALSE(registry.needsPruning());

    auto activity = make_activity(40);
    activity->SetRecorded(false);
    activity->SetAllDataRequested(false);
    registry.insert(SpanId{40}, make_child_entry(std::make_shared<NoopSpan>(), activity));

    EXPECT_EQ(registry.prune(), 0);
    EXPECT_EQ(registry.size(), 1);
}

TEST_F(SpanRegistryTest, ForcedPruneRemovesFilteredTest) {
    SpanRegistry registry(std::chrono::milliseconds(5000));

    auto recorded = make_activity(1);

    auto requested = make_activity(2);
    requested->SetRecorded(false);

    auto filtered = make_activity(3);
    filtered->SetRecorded(false);
    filtered->SetAllDataRequested(false);

    auto expired = make_activity(4);

    registry.insert(SpanId{1}, make_child_entry(std::make_shared<NoopSpan>(), recorded));
    registry.insert(SpanId{2}, make_child_entry(std::make_shared<NoopSpan>(), requested));
    registry.insert(SpanId{3}, make_child_entry(std::make_shared<NoopSpan>(), filtered));
    registry.insert(SpanId{4}, make_child_entry(std::make_shared<NoopSpan>(), expired));
    expired.reset();

    EXPECT_EQ(registry.prune(true), 2);
    EXPECT_EQ(registry.size(), 2);
    EXPECT_TRUE(registry.get(SpanId{1}).has_value());
    EXPECT_TRUE(registry.get(SpanId{2}).has_value());
    EXPECT_FALSE(registry.get(SpanId{3}).has_value());
    EXPECT_FALSE(registry.get(SpanId{4}).has_value());
}

TEST_F(SpanRegistryTest, PruneAfterIntervalTest) {
    SpanRegistry registry(std::chrono::milliseconds(100));

    auto filtered = make_activity(5);
    filtered->SetRecorded(false);
    filtered->SetAllDataRequested(false);
    registry.insert(SpanId{5}, make_child_entry(std::make_shared<NoopSpan>(), filtered));

    EXPECT_EQ(registry.prune(), 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(registry.prune(), 1);
    EXPECT_EQ(registry.size(), 0);
    EXPECT_FALSE(registry.needsPruning()) << "Sweep resets the interval";
}

TEST_F(SpanRegistryTest, SingleWinnerPerIntervalTest) {
    SpanRegistry registry(std::chrono::milliseconds(100));
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    constexpr int thread_count = 8;
    std::atomic<int> winners{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int i = 0; i < thread_count; i++) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (registry.needsPruning()) {
                winners++;
            }
        });
    }
    go.store(true);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
}

TEST_F(SpanRegistryTest, ConcurrentInsertRemoveTest) {
    SpanRegistry registry(std::chrono::milliseconds(100));
    constexpr int thread_count = 4;
    constexpr int per_thread = 200;
    std::vector<std::thread> threads;

    for (int t = 0; t < thread_count; t++) {
        threads.emplace_back([&registry, t]() {
            for (int i = 1; i <= per_thread; i++) {
                const SpanId id{static_cast<uint64_t>(t * 1000 + i)};
                auto activity = make_activity(id.Value);
                registry.insert(id, make_child_entry(std::make_shared<NoopSpan>(), activity));
                registry.prune();
                registry.remove(id);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(registry.size(), 0);
}

}  // namespace tracebridge
