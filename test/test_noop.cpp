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
#include <memory>

#include "../src/noop.h"
#include "../include/tracebridge/tracer.h"

namespace tracebridge {

class NoopTest : public ::testing::Test {};

TEST_F(NoopTest, SharedInstancesTest) {
    EXPECT_EQ(noopHub(), noopHub());
    EXPECT_EQ(noopSpan(), noopSpan());
    EXPECT_EQ(noopTransaction(), noopTransaction());
}

TEST_F(NoopTest, NoopSpanTest) {
    auto span = noopSpan();

    span->SetOperation("db");
    span->SetDescription("SELECT 1");
    span->SetStatus(SPAN_STATUS_ABORTED);
    span->SetExtra("key", std::string("value"));
    span->Finish();

    EXPECT_FALSE(span->GetTraceId().IsValid());
    EXPECT_FALSE(span->GetSpanId().IsValid());
    EXPECT_FALSE(span->IsSampled());
    EXPECT_EQ(span->GetOperation(), "");
    EXPECT_FALSE(span->GetStatus().has_value());
    EXPECT_TRUE(span->GetExtras().empty());
    EXPECT_FALSE(span->IsFinished());
    EXPECT_FALSE(span->IsFiltered());
    EXPECT_EQ(span->StartChild(SpanContext{}), noopSpan());
}

TEST_F(NoopTest, NoopTransactionCarriesIdsTest) {
    TransactionContext context;
    context.trace_id = TraceId{7, 8};
    context.span_id = SpanId{9};
    context.parent_span_id = SpanId{10};

    auto tx = noopTransaction(context);
    EXPECT_NE(tx, noopTransaction());
    EXPECT_EQ(tx->GetTraceId(), (TraceId{7, 8}));
    EXPECT_EQ(tx->GetSpanId(), SpanId{9});
    EXPECT_EQ(tx->GetParentSpanId(), SpanId{10});

    tx->SetName("ignored");
    tx->SetContext("otel", ContextObject{});
    EXPECT_EQ(tx->GetName(), "");
    EXPECT_TRUE(tx->GetContexts().empty());
    EXPECT_FALSE(tx->GetDynamicSamplingContext().has_value());

    SpanContext child_context;
    child_context.span_id = SpanId{11};
    auto child = tx->StartChild(child_context);
    EXPECT_NE(child, noopSpan());
    EXPECT_EQ(child->GetTraceId(), (TraceId{7, 8}));
    EXPECT_EQ(child->GetSpanId(), SpanId{11});
    EXPECT_EQ(child->GetParentSpanId(), SpanId{9});
    EXPECT_FALSE(child->IsSampled());

    auto grandchild = child->StartChild(SpanContext{});
    EXPECT_EQ(grandchild, noopSpan());
}

TEST_F(NoopTest, NoopHubTest) {
    auto hub = noopHub();

    EXPECT_FALSE(hub->Enable());
    EXPECT_EQ(hub->StartTransaction(TransactionContext{}, {}, std::nullopt), noopTransaction());

    bool configured = false;
    hub->ConfigureScope([&configured](Scope&) { configured = true; });
    EXPECT_FALSE(configured);

    EXPECT_EQ(hub->CaptureEvent(ErrorEvent{}, nullptr), "");
    ASSERT_NE(hub->GetScope(), nullptr);
    EXPECT_EQ(hub->GetScope()->GetTransaction(), nullptr);

    hub->Shutdown();
}

TEST_F(NoopTest, GlobalHubBeforeCreateTest) {
    auto hub = GlobalHub();

    ASSERT_NE(hub, nullptr);
    EXPECT_FALSE(hub->Enable());
}

}  // namespace tracebridge
