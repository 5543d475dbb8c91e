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

#include <stdexcept>

#include "logging.h"
#include "noop.h"
#include "span.h"
#include "utility.h"
#include "hub.h"

namespace tracebridge {

    static std::mutex global_hub_mutex;
    static HubPtr global_hub{nullptr};

    static Dsn parse_dsn_or_throw(const std::string& dsn) {
        auto parsed = parse_dsn(dsn);
        if (!parsed) {
            throw std::invalid_argument("invalid dsn = '" + dsn + "'");
        }
        return *parsed;
    }

    HubImpl::HubImpl(const Config& options, TransportPtr transport, TracesSampler sampler) :
        config_(options),
        instrumenter_(options.otelInstrumenter() ? INSTRUMENTER_OPENTELEMETRY : INSTRUMENTER_NATIVE),
        dsn_(parse_dsn_or_throw(options.dsn)),
        backend_filter_(dsn_, options.backend.exclude_url),
        transport_(std::move(transport)),
        sampler_(std::move(sampler)),
        scope_(std::make_shared<Scope>()),
        shutting_down_(false),
        enabled_(true) {

        if (!transport_) {
            throw std::invalid_argument("transport is null");
        }
        LOG_INFO("hub created: project = {}, host = {}", dsn_.project_id, dsn_.host);
    }

    HubImpl::~HubImpl() {
        shutting_down_ = true;
    }

    bool HubImpl::sample(const TransactionContext& context, const SamplingContext& custom_sampling_context) const {
        if (context.sampled.has_value()) {
            return *context.sampled;
        }
        if (sampler_) {
            return sampler_(context, custom_sampling_context);
        }
        return true;
    }

    TransactionPtr HubImpl::StartTransaction(const TransactionContext& context,
                                             const SamplingContext& custom_sampling_context,
                                             std::optional<DynamicSamplingContext> dynamic_sampling_context) try {
        if (!enabled_ || shutting_down_) {
            return noopTransaction(context);
        }

        if (context.instrumenter != instrumenter_) {
            LOG_WARN("transaction '{}' was started by an instrumenter this hub is not configured for", context.name);
            return noopTransaction(context);
        }

        const bool sampled = sample(context, custom_sampling_context);
        return std::make_shared<TransactionImpl>(this, context, sampled, std::move(dynamic_sampling_context));
    } catch (const std::exception& e) {
        LOG_ERROR("start transaction exception = {}", e.what());
        return noopTransaction(context);
    }

    void HubImpl::ConfigureScope(const std::function<void(Scope&)>& configure) try {
        if (!configure) {
            return;
        }
        std::lock_guard<std::mutex> lock(scope_mutex_);
        configure(*scope_);
    } catch (const std::exception& e) {
        LOG_ERROR("configure scope exception = {}", e.what());
    }

    void HubImpl::RestoreScope(const ScopePtr& scope) {
        if (!scope) {
            return;
        }
        std::lock_guard<std::mutex> lock(scope_mutex_);
        scope_ = scope;
    }

    ScopePtr HubImpl::GetScope() const {
        std::lock_guard<std::mutex> lock(scope_mutex_);
        return scope_;
    }

    std::string HubImpl::CaptureEvent(const ErrorEvent& event, const std::function<void(Scope&)>& configure) try {
        if (!enabled_ || shutting_down_) {
            return "";
        }

        ScopePtr scope;
        {
            std::lock_guard<std::mutex> lock(scope_mutex_);
            scope = scope_->Clone();
        }
        if (const auto transaction = scope->GetTransaction(); transaction && !scope->GetTraceContext().trace_id.IsValid()) {
            auto& trace = scope->GetTraceContext();
            trace.trace_id = transaction->GetTraceId();
            trace.span_id = transaction->GetSpanId();
            trace.parent_span_id = transaction->GetParentSpanId();
        }
        if (configure) {
            configure(*scope);
        }

        ErrorEvent captured = event;
        captured.event_id = generate_event_id();
        captured.trace = scope->GetTraceContext();

        transport_->SendEvent(captured);
        LOG_DEBUG("event captured: id = {}, type = {}", captured.event_id, captured.exception.Type);
        return captured.event_id;
    } catch (const std::exception& e) {
        LOG_ERROR("capture event exception = {}", e.what());
        return "";
    }

    bool HubImpl::Enable() {
        return enabled_ && !shutting_down_;
    }

    void HubImpl::Shutdown() {
        if (shutting_down_.exchange(true)) {
            return;
        }

        LOG_INFO("hub shutdown");

        HubPtr previous;
        {
            std::lock_guard<std::mutex> lock(global_hub_mutex);
            if (global_hub.get() == this) {
                previous = std::move(global_hub);
                global_hub = noopHub();
            }
        }
        shutdown_logger();
    }

    bool HubImpl::isBackendRequest(std::string_view url) const {
        return backend_filter_.isBackendRequest(url);
    }

    void HubImpl::recordTransaction(const TransactionPtr& transaction) try {
        {
            std::lock_guard<std::mutex> lock(scope_mutex_);
            if (scope_->GetTransaction() == transaction) {
                scope_->SetTransaction(nullptr);
            }
        }

        if (!transaction->IsSampled()) {
            LOG_DEBUG("drop unsampled transaction: {}", transaction->GetSpanId().ToString());
            return;
        }
        if (transaction->IsBackendRequest()) {
            LOG_DEBUG("drop backend request transaction: {}", transaction->GetSpanId().ToString());
            return;
        }

        std::vector<SpanPtr> spans;
        if (const auto impl = std::dynamic_pointer_cast<TransactionImpl>(transaction)) {
            for (const auto& child : impl->getChildren()) {
                if (child->IsFinished() && !child->IsFiltered() && !child->IsBackendRequest()) {
                    spans.push_back(child);
                }
            }
        }

        transport_->SendTransaction(transaction, spans);
    } catch (const std::exception& e) {
        LOG_ERROR("record transaction exception = {}", e.what());
    }

    HubPtr make_hub(const Config& cfg, TransportPtr transport, TracesSampler sampler) {
        if (!cfg.enable) {
            LOG_INFO("tracing is disabled");
            return noopHub();
        }
        if (cfg.dsn.empty()) {
            LOG_ERROR("dsn is required");
            return noopHub();
        }

        try {
            return std::make_shared<HubImpl>(cfg, std::move(transport), std::move(sampler));
        } catch (const std::exception& e) {
            LOG_ERROR("make hub exception = {}", e.what());
            return noopHub();
        }
    }

    void SetConfigFilePath(std::string_view config_file_path) {
        read_config_from_file(std::string(config_file_path).c_str());
    }

    void SetConfigString(std::string_view config_string) {
        set_config_string(config_string);
    }

    HubPtr CreateHub(TransportPtr transport) {
        return CreateHub(std::move(transport), nullptr);
    }

    HubPtr CreateHub(TransportPtr transport, TracesSampler sampler) {
        std::lock_guard<std::mutex> lock(global_hub_mutex);
        if (global_hub != nullptr && global_hub->Enable()) {
            LOG_WARN("hub is already created");
            return global_hub;
        }

        Config cfg = make_config();
        global_hub = make_hub(cfg, std::move(transport), std::move(sampler));
        return global_hub;
    }

    HubPtr GlobalHub() {
        std::lock_guard<std::mutex> lock(global_hub_mutex);
        if (global_hub == nullptr) {
            return noopHub();
        }
        return global_hub;
    }

}  // namespace tracebridge
