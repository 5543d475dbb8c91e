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
#include <mutex>

#include "tracebridge/tracer.h"
#include "config.h"
#include "http.h"
#include "hub_service.h"

namespace tracebridge {

    /**
     * @brief Concrete hub that creates transactions and forwards finished data to the transport.
     *
     * `HubImpl` implements both `Hub` (SDK surface) and `HubService` (internal service boundary).
     * It keeps a single process-wide scope.
     */
    class HubImpl final : public Hub, public HubService {
    public:
        /**
         * @brief Constructs a hub using the provided configuration.
         *
         * @throws std::invalid_argument when the DSN cannot be parsed or `transport` is null.
         */
        HubImpl(const Config& options, TransportPtr transport, TracesSampler sampler = nullptr);
        ~HubImpl() override;

        TransactionPtr StartTransaction(const TransactionContext& context,
                                        const SamplingContext& custom_sampling_context,
                                        std::optional<DynamicSamplingContext> dynamic_sampling_context) override;
        /// @brief Runs `configure` under the scope lock. It must not call back into the hub.
        void ConfigureScope(const std::function<void(Scope&)>& configure) override;
        void RestoreScope(const ScopePtr& scope) override;
        ScopePtr GetScope() const override;
        std::string CaptureEvent(const ErrorEvent& event, const std::function<void(Scope&)>& configure) override;
        bool Enable() override;
        void Shutdown() override;

        bool isExiting() const override { return shutting_down_; }
        const Config* getConfig() const override { return &config_; }
        bool isBackendRequest(std::string_view url) const override;
        void recordTransaction(const TransactionPtr& transaction) override;

    private:
        bool sample(const TransactionContext& context, const SamplingContext& custom_sampling_context) const;

        Config config_;
        Instrumenter instrumenter_;
        Dsn dsn_;
        BackendUrlFilter backend_filter_;
        TransportPtr transport_;
        TracesSampler sampler_;

        mutable std::mutex scope_mutex_;
        ScopePtr scope_;

        std::atomic<bool> shutting_down_;
        bool enabled_;
    };

    /**
     * @brief Builds a hub for `cfg`, or a no-op hub when tracing is disabled or misconfigured.
     */
    HubPtr make_hub(const Config& cfg, TransportPtr transport, TracesSampler sampler);

}  // namespace tracebridge
