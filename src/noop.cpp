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

namespace tracebridge {

    static Noop noop;

    SpanPtr noopSpan() {
        return noop.span();
    }

    SpanPtr noopSpan(const SpanContext& context) {
        if (!context.span_id.IsValid()) {
            return noop.span();
        }
        return std::make_shared<NoopSpan>(context);
    }

    TransactionPtr noopTransaction() {
        return noop.transaction();
    }

    TransactionPtr noopTransaction(const TransactionContext& context) {
        if (!context.span_id.IsValid()) {
            return noop.transaction();
        }
        return std::make_shared<NoopTransaction>(context);
    }

    HubPtr noopHub() {
        return noop.hub();
    }
}
