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

#include <string_view>

#include "tracebridge/tracer.h"

namespace tracebridge {

    struct Config;

    /**
     * @brief Internal service boundary between spans, the processor and the hub.
     *
     * Spans report their completion here and the activity processor uses it to read the
     * resolved configuration without depending on the concrete hub.
     */
    class HubService {
    public:
        virtual ~HubService() = default;

        /// @brief Returns `true` when the shutdown sequence is in progress.
        virtual bool isExiting() const = 0;
        /// @brief Returns the resolved configuration, or `nullptr` when the hub was never initialized.
        virtual const Config* getConfig() const = 0;

        /**
         * @brief Tests whether a URL targets the backend's own ingestion endpoint.
         */
        virtual bool isBackendRequest(std::string_view url) const = 0;
        /**
         * @brief Hands a finished transaction to the transport.
         *
         * Unsampled and backend-request transactions are dropped. Child spans that are
         * unfinished, filtered or flagged as backend requests are left out.
         */
        virtual void recordTransaction(const TransactionPtr& transaction) = 0;
    };

}  // namespace tracebridge
