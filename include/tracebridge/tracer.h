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

#ifndef TRACEBRIDGE_TRACER_H
#define TRACEBRIDGE_TRACER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tracebridge {

	/**
	 * @brief Attribute keys defined by the OpenTelemetry semantic conventions.
	 */
	namespace semconv {
		const std::string HTTP_METHOD = "http.method";
		const std::string HTTP_ROUTE = "http.route";
		const std::string HTTP_TARGET = "http.target";
		const std::string HTTP_URL = "http.url";
		const std::string URL_FULL = "url.full";
		const std::string HTTP_STATUS_CODE = "http.status_code";
		const std::string RPC_SERVICE = "rpc.service";
		const std::string RPC_GRPC_STATUS_CODE = "rpc.grpc.status_code";
		const std::string DB_SYSTEM = "db.system";
		const std::string DB_STATEMENT = "db.statement";
		const std::string MESSAGING_SYSTEM = "messaging.system";
		const std::string FAAS_TRIGGER = "faas.trigger";

		const std::string EXCEPTION_EVENT_NAME = "exception";
		const std::string EXCEPTION_TYPE = "exception.type";
		const std::string EXCEPTION_MESSAGE = "exception.message";
		const std::string EXCEPTION_STACKTRACE = "exception.stacktrace";

		const std::string OTEL_STATUS_CODE = "otel.status_code";
		const std::string OTEL_STATUS_ERROR = "ERROR";
		const std::string OTEL_KIND = "otel.kind";
	}

	const std::string OP_HTTP_CLIENT = "http.client";
	const std::string OP_HTTP_SERVER = "http.server";
	const std::string OP_DB = "db";
	const std::string OP_RPC = "rpc";
	const std::string OP_MESSAGE = "message";

	/// Key of the context object that carries activity and resource attributes.
	const std::string CONTEXT_OTEL = "otel";

	using TimePoint = std::chrono::system_clock::time_point;

	/**
	 * @brief 128-bit distributed trace identifier.
	 */
	struct TraceId {
		uint64_t High = 0;
		uint64_t Low = 0;

		bool IsValid() const { return High != 0 || Low != 0; }

		/**
		 * @brief Serializes the identifier as 32 lowercase hex characters.
		 */
		std::string ToString() const {
			std::ostringstream out;
			out << std::hex << std::setfill('0') << std::setw(16) << High << std::setw(16) << Low;
			return out.str();
		}

		bool operator==(const TraceId& o) const { return High == o.High && Low == o.Low; }
		bool operator!=(const TraceId& o) const { return !(*this == o); }
	};

	/**
	 * @brief 64-bit span identifier. Zero means "unset".
	 */
	struct SpanId {
		uint64_t Value = 0;

		bool IsValid() const { return Value != 0; }

		/**
		 * @brief Serializes the identifier as 16 lowercase hex characters.
		 */
		std::string ToString() const {
			std::ostringstream out;
			out << std::hex << std::setfill('0') << std::setw(16) << Value;
			return out.str();
		}

		bool operator==(const SpanId& o) const { return Value == o.Value; }
		bool operator!=(const SpanId& o) const { return !(*this == o); }
	};

	/**
	 * @brief Role of the activity in the communication it represents.
	 */
	enum ActivityKind {
		ACTIVITY_KIND_INTERNAL = 0,
		ACTIVITY_KIND_SERVER,
		ACTIVITY_KIND_CLIENT,
		ACTIVITY_KIND_PRODUCER,
		ACTIVITY_KIND_CONSUMER
	};

	/**
	 * @brief Status reported by the instrumentation for a completed activity.
	 */
	enum ActivityStatusCode {
		ACTIVITY_STATUS_UNSET = 0,
		ACTIVITY_STATUS_OK,
		ACTIVITY_STATUS_ERROR
	};

	/**
	 * @brief Span status understood by the tracing backend.
	 */
	enum SpanStatus {
		SPAN_STATUS_OK = 0,
		SPAN_STATUS_CANCELLED,
		SPAN_STATUS_UNKNOWN_ERROR,
		SPAN_STATUS_INVALID_ARGUMENT,
		SPAN_STATUS_DEADLINE_EXCEEDED,
		SPAN_STATUS_NOT_FOUND,
		SPAN_STATUS_ALREADY_EXISTS,
		SPAN_STATUS_PERMISSION_DENIED,
		SPAN_STATUS_RESOURCE_EXHAUSTED,
		SPAN_STATUS_FAILED_PRECONDITION,
		SPAN_STATUS_ABORTED,
		SPAN_STATUS_OUT_OF_RANGE,
		SPAN_STATUS_UNIMPLEMENTED,
		SPAN_STATUS_INTERNAL_ERROR,
		SPAN_STATUS_UNAVAILABLE,
		SPAN_STATUS_DATA_LOSS,
		SPAN_STATUS_UNAUTHENTICATED
	};

	/**
	 * @brief Describes how a transaction name was derived.
	 */
	enum TransactionNameSource {
		NAME_SOURCE_CUSTOM = 0,
		NAME_SOURCE_URL,
		NAME_SOURCE_ROUTE,
		NAME_SOURCE_TASK
	};

	/**
	 * @brief Identifies which instrumentation layer produced a span.
	 */
	enum Instrumenter {
		INSTRUMENTER_NATIVE = 0,
		INSTRUMENTER_OPENTELEMETRY
	};

	/// @brief Returns the backend name of a span status (e.g. `not_found`).
	std::string_view to_string(SpanStatus status);
	/// @brief Returns the backend name of a name source (e.g. `route`).
	std::string_view to_string(TransactionNameSource source);
	/// @brief Returns the display name of an activity kind (e.g. `Client`).
	std::string_view to_string(ActivityKind kind);

	/**
	 * @brief Heterogeneous attribute value. `std::monostate` represents null.
	 */
	using AttributeValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
	/// @brief Attribute list in the order the instrumentation produced it.
	using Attributes = std::vector<std::pair<std::string, AttributeValue>>;
	/// @brief Attribute dictionary after normalization.
	using AttributeDict = std::map<std::string, AttributeValue>;

	/**
	 * @brief Backend-specific context object attached to transactions and events.
	 */
	struct ContextObject {
		/// Nested dictionaries such as `attributes` and `resource`.
		std::map<std::string, AttributeDict> dicts;
		/// Flat values such as `stack_trace`.
		AttributeDict values;

		bool empty() const { return dicts.empty() && values.empty(); }
	};

	using Contexts = std::map<std::string, ContextObject>;

	/**
	 * @brief Timestamped marker recorded on an activity (e.g. an exception).
	 */
	struct ActivityEvent {
		std::string Name;
		TimePoint Timestamp;
		Attributes Tags;
	};

	class Span;
	class Transaction;
	class Scope;
	class Activity;
	using SpanPtr = std::shared_ptr<Span>;
	using TransactionPtr = std::shared_ptr<Transaction>;
	using ScopePtr = std::shared_ptr<Scope>;
	using ActivityPtr = std::shared_ptr<Activity>;

	/**
	 * @brief Runtime-activity record produced by application or framework instrumentation.
	 *
	 * Identity, timing and attributes are written by the instrumentation layer. The
	 * recorded flags may change from any thread at any time. The span and scope slots
	 * let other layers discover the span created for this activity and the scope that
	 * was current when it started.
	 */
	class Activity {
	public:
		Activity(std::string_view operation_name, TraceId trace_id, SpanId span_id)
			: operation_name_(operation_name), display_name_(operation_name),
			  trace_id_(trace_id), span_id_(span_id), parent_span_id_{0},
			  start_time_(std::chrono::system_clock::now()), duration_{},
			  kind_(ACTIVITY_KIND_INTERNAL), status_(ACTIVITY_STATUS_UNSET),
			  has_remote_parent_(false), recorded_(true), all_data_requested_(true) {}
		~Activity() = default;

		Activity(const Activity&) = delete;
		Activity& operator=(const Activity&) = delete;

		const std::string& GetOperationName() const { return operation_name_; }
		const std::string& GetDisplayName() const { return display_name_; }
		void SetDisplayName(std::string_view name) { display_name_ = name; }

		TraceId GetTraceId() const { return trace_id_; }
		SpanId GetSpanId() const { return span_id_; }
		SpanId GetParentSpanId() const { return parent_span_id_; }
		void SetParentSpanId(SpanId parent_span_id) { parent_span_id_ = parent_span_id; }

		/// @brief Links the in-process parent activity and inherits its trace and span id.
		void SetParent(const ActivityPtr& parent) {
			parent_ = parent;
			if (parent) {
				trace_id_ = parent->GetTraceId();
				parent_span_id_ = parent->GetSpanId();
			}
		}
		const ActivityPtr& GetParent() const { return parent_; }

		TimePoint GetStartTime() const { return start_time_; }
		void SetStartTime(TimePoint start_time) { start_time_ = start_time; }
		std::chrono::system_clock::duration GetDuration() const { return duration_; }
		void SetDuration(std::chrono::system_clock::duration duration) { duration_ = duration; }

		ActivityKind GetKind() const { return kind_; }
		void SetKind(ActivityKind kind) { kind_ = kind; }

		ActivityStatusCode GetStatus() const { return status_; }
		void SetStatus(ActivityStatusCode status) { status_ = status; }

		bool HasRemoteParent() const { return has_remote_parent_; }
		void SetHasRemoteParent(bool remote) { has_remote_parent_ = remote; }

		bool IsRecorded() const { return recorded_.load(); }
		void SetRecorded(bool recorded) { recorded_.store(recorded); }
		bool IsAllDataRequested() const { return all_data_requested_.load(); }
		void SetAllDataRequested(bool requested) { all_data_requested_.store(requested); }

		const Attributes& GetTags() const { return tags_; }
		void SetTag(std::string_view key, AttributeValue value) { tags_.emplace_back(key, std::move(value)); }

		const std::vector<ActivityEvent>& GetEvents() const { return events_; }
		void AddEvent(ActivityEvent event) { events_.push_back(std::move(event)); }

		const std::vector<std::pair<std::string, std::string>>& GetBaggage() const { return baggage_; }
		void AddBaggage(std::string_view key, std::string_view value) { baggage_.emplace_back(key, value); }

		std::exception_ptr GetException() const { return exception_; }
		void SetException(std::exception_ptr exception) { exception_ = std::move(exception); }

		/// @brief Binds the span that represents this activity.
		void BindSpan(SpanPtr span) {
			std::lock_guard<std::mutex> lock(mutex_);
			span_ = std::move(span);
		}
		SpanPtr GetBoundSpan() const {
			std::lock_guard<std::mutex> lock(mutex_);
			return span_;
		}

		/// @brief Saves the scope that should be current while this activity is finalized.
		void SetScope(ScopePtr scope) {
			std::lock_guard<std::mutex> lock(mutex_);
			scope_ = std::move(scope);
		}
		ScopePtr GetScope() const {
			std::lock_guard<std::mutex> lock(mutex_);
			return scope_;
		}

	private:
		std::string operation_name_;
		std::string display_name_;
		TraceId trace_id_;
		SpanId span_id_;
		SpanId parent_span_id_;
		ActivityPtr parent_;
		TimePoint start_time_;
		std::chrono::system_clock::duration duration_;
		ActivityKind kind_;
		ActivityStatusCode status_;
		bool has_remote_parent_;
		std::atomic<bool> recorded_;
		std::atomic<bool> all_data_requested_;
		Attributes tags_;
		std::vector<ActivityEvent> events_;
		std::vector<std::pair<std::string, std::string>> baggage_;
		std::exception_ptr exception_;

		mutable std::mutex mutex_;
		SpanPtr span_;
		ScopePtr scope_;
	};

	/**
	 * @brief Identity and naming used to start a child span.
	 */
	struct SpanContext {
		std::string operation;
		SpanId span_id;
		SpanId parent_span_id;
		TraceId trace_id;
		std::string description;
		Instrumenter instrumenter = INSTRUMENTER_NATIVE;
	};

	/**
	 * @brief Identity, naming and sampling state used to start a transaction.
	 */
	struct TransactionContext {
		std::string name;
		std::string operation;
		SpanId span_id;
		SpanId parent_span_id;
		TraceId trace_id;
		std::string description;
		std::optional<bool> sampled;
		std::optional<bool> parent_sampled;
		Instrumenter instrumenter = INSTRUMENTER_NATIVE;
	};

	/**
	 * @brief Trace-wide sampling metadata propagated through baggage.
	 *
	 * The entries are forwarded to the backend unchanged.
	 */
	class DynamicSamplingContext {
	public:
		explicit DynamicSamplingContext(std::map<std::string, std::string> items) : items_(std::move(items)) {}

		const std::map<std::string, std::string>& Items() const { return items_; }
		std::optional<std::string> Get(std::string_view key) const {
			if (const auto it = items_.find(std::string(key)); it != items_.end()) {
				return it->second;
			}
			return std::nullopt;
		}

	private:
		std::map<std::string, std::string> items_;
	};

	/// @brief Free-form values made available to an external sampler.
	using SamplingContext = std::map<std::string, AttributeValue>;

	/**
	 * @brief Interface implemented by spans and transactions.
	 */
	class Span {
	public:
		virtual ~Span() = default;

		/// @brief Starts a child span in the same transaction.
		virtual SpanPtr StartChild(const SpanContext& context) = 0;

		virtual TraceId GetTraceId() const = 0;
		virtual SpanId GetSpanId() const = 0;
		virtual SpanId GetParentSpanId() const = 0;
		virtual bool IsSampled() const = 0;

		virtual std::string GetOperation() const = 0;
		virtual void SetOperation(std::string_view operation) = 0;
		virtual std::string GetDescription() const = 0;
		virtual void SetDescription(std::string_view description) = 0;

		virtual TimePoint GetStartTimestamp() const = 0;
		virtual void SetStartTimestamp(TimePoint timestamp) = 0;
		virtual std::optional<TimePoint> GetEndTimestamp() const = 0;
		virtual void SetEndTimestamp(TimePoint timestamp) = 0;

		/// @brief Returns the status, if one was set or the span finished.
		virtual std::optional<SpanStatus> GetStatus() const = 0;
		virtual void SetStatus(SpanStatus status) = 0;

		/// @brief Records an extra key/value pair (sent as span data).
		virtual void SetExtra(std::string_view key, AttributeValue value) = 0;
		virtual AttributeDict GetExtras() const = 0;

		/// @brief Installs a predicate deciding at transaction finish whether to drop the span.
		virtual void SetFiltered(std::function<bool()> predicate) = 0;
		virtual bool IsFiltered() const = 0;

		/// @brief Marks the span as the backend's own traffic.
		virtual void SetBackendRequest(bool backend_request) = 0;
		virtual bool IsBackendRequest() const = 0;

		/// @brief Finishes the span with status `ok` unless a status was already set.
		virtual void Finish() = 0;
		/// @brief Finishes the span with the given status.
		virtual void Finish(SpanStatus status) = 0;
		/// @brief Finishes the span as failed by the given exception.
		virtual void Finish(std::exception_ptr exception) = 0;
		virtual bool IsFinished() const = 0;
		virtual std::exception_ptr GetException() const = 0;
	};

	/**
	 * @brief Root span of a trace, carrying a name and backend context.
	 */
	class Transaction : public Span {
	public:
		~Transaction() override = default;

		virtual std::string GetName() const = 0;
		virtual void SetName(std::string_view name) = 0;
		virtual TransactionNameSource GetNameSource() const = 0;
		virtual void SetNameSource(TransactionNameSource source) = 0;

		virtual void SetContext(std::string_view key, ContextObject context) = 0;
		virtual Contexts GetContexts() const = 0;

		virtual std::optional<DynamicSamplingContext> GetDynamicSamplingContext() const = 0;
	};

	/**
	 * @brief Trace identity stamped onto captured events.
	 */
	struct TraceContext {
		TraceId trace_id;
		SpanId span_id;
		SpanId parent_span_id;
	};

	/**
	 * @brief Ambient state applied to data captured through the hub.
	 */
	class Scope {
	public:
		Scope() : trace_{} {}

		TransactionPtr GetTransaction() const { return transaction_; }
		void SetTransaction(TransactionPtr transaction) { transaction_ = std::move(transaction); }

		TraceContext& GetTraceContext() { return trace_; }
		const TraceContext& GetTraceContext() const { return trace_; }

		ScopePtr Clone() const { return std::make_shared<Scope>(*this); }

	private:
		TransactionPtr transaction_;
		TraceContext trace_;
	};

	/**
	 * @brief Minimal exception reconstructed from an exception event marker.
	 */
	struct SyntheticException {
		std::string Type;
		std::string Message;
		std::string Mechanism;
	};

	/**
	 * @brief Error report submitted to the backend.
	 */
	struct ErrorEvent {
		std::string event_id;
		SyntheticException exception;
		TimePoint timestamp;
		Contexts contexts;
		TraceContext trace;
	};

	/**
	 * @brief Delivery sink for finished transactions and error events.
	 */
	class Transport {
	public:
		virtual ~Transport() = default;

		/**
		 * @brief Sends a finished transaction together with its finished child spans.
		 */
		virtual void SendTransaction(const TransactionPtr& transaction, const std::vector<SpanPtr>& spans) = 0;
		/// @brief Sends an error event.
		virtual void SendEvent(const ErrorEvent& event) = 0;
	};

	using TransportPtr = std::shared_ptr<Transport>;
	/// @brief External sampling decision for transactions that carry none.
	using TracesSampler = std::function<bool(const TransactionContext&, const SamplingContext&)>;

	/**
	 * @brief Entry point for starting transactions and capturing events.
	 */
	class Hub {
	public:
		virtual ~Hub() = default;

		/**
		 * @brief Starts a new transaction.
		 *
		 * @param context Identity and sampling state of the transaction.
		 * @param custom_sampling_context Values forwarded to the external sampler.
		 * @param dynamic_sampling_context Propagated sampling metadata, forwarded unchanged.
		 */
		virtual TransactionPtr StartTransaction(const TransactionContext& context,
		                                        const SamplingContext& custom_sampling_context,
		                                        std::optional<DynamicSamplingContext> dynamic_sampling_context) = 0;
		/// @brief Runs `configure` against the current scope.
		virtual void ConfigureScope(const std::function<void(Scope&)>& configure) = 0;
		/// @brief Makes `scope` the current scope.
		virtual void RestoreScope(const ScopePtr& scope) = 0;
		/// @brief Returns the current scope.
		virtual ScopePtr GetScope() const = 0;
		/**
		 * @brief Captures an error event.
		 *
		 * @param event Event to send.
		 * @param configure Mutator applied to a copy of the current scope for this event only.
		 * @return Identifier assigned to the event, empty when dropped.
		 */
		virtual std::string CaptureEvent(const ErrorEvent& event, const std::function<void(Scope&)>& configure) = 0;
		/// @brief Returns whether the hub is initialized and tracing.
		virtual bool Enable() = 0;
		/// @brief Stops tracing. Later calls become no-ops.
		virtual void Shutdown() = 0;
	};

	using HubPtr = std::shared_ptr<Hub>;

	/**
	 * @brief Receives activity start and end notifications and maps them onto spans.
	 */
	class ActivityListener {
	public:
		virtual ~ActivityListener() = default;

		/// @brief Called when an activity starts. Safe to call from any thread.
		virtual void OnStart(const ActivityPtr& activity) = 0;
		/// @brief Called when an activity ends. Safe to call from any thread.
		virtual void OnEnd(const ActivityPtr& activity) = 0;
		/// @brief Returns the in-flight span mapped to the activity, or null.
		virtual SpanPtr GetMappedSpan(SpanId span_id) const = 0;
	};

	using ActivityListenerPtr = std::shared_ptr<ActivityListener>;
	/// @brief Last-moment customization invoked before a span is finished.
	using BeforeFinishCallback = std::function<void(const SpanPtr&, const Activity&)>;
	/// @brief Supplies process-wide resource attributes. Called at most once per listener.
	using ResourceAttributeResolver = std::function<AttributeDict()>;

	/// @brief Appends the members of a W3C `baggage` header value to the activity's baggage.
	void AddBaggageHeader(Activity& activity, std::string_view header);

	/// @brief Set the configuration file path used by the global hub.
	void SetConfigFilePath(std::string_view config_file_path);
	/// @brief Inject raw configuration YAML directly.
	void SetConfigString(std::string_view config_string);

	/// @brief Creates the global hub using the global configuration.
	HubPtr CreateHub(TransportPtr transport);
	/// @brief Creates the global hub with an external sampler for undecided transactions.
	HubPtr CreateHub(TransportPtr transport, TracesSampler sampler);
	/// @brief Returns the global hub, or a no-op hub before creation.
	HubPtr GlobalHub();

	/**
	 * @brief Creates an activity listener bound to `hub`.
	 *
	 * @throws std::invalid_argument when `hub` is not an initialized hub.
	 */
	ActivityListenerPtr NewActivityListener(const HubPtr& hub,
	                                        BeforeFinishCallback before_finish = nullptr,
	                                        ResourceAttributeResolver resource_resolver = nullptr);

}  // namespace tracebridge

#endif //TRACEBRIDGE_TRACER_H
