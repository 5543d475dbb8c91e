#include <cstdlib>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "tracebridge/tracer.h"

// Prints what would be delivered to the backend.
class StdoutTransport : public tracebridge::Transport {
public:
    void SendTransaction(const tracebridge::TransactionPtr& transaction,
                         const std::vector<tracebridge::SpanPtr>& spans) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "transaction " << transaction->GetName()
                  << " op=" << transaction->GetOperation()
                  << " status=" << tracebridge::to_string(transaction->GetStatus().value_or(tracebridge::SPAN_STATUS_OK))
                  << " trace=" << transaction->GetTraceId().ToString() << std::endl;
        for (const auto& span : spans) {
            std::cout << "  span " << span->GetOperation() << " '" << span->GetDescription() << "'"
                      << " status=" << tracebridge::to_string(span->GetStatus().value_or(tracebridge::SPAN_STATUS_OK))
                      << std::endl;
        }
    }

    void SendEvent(const tracebridge::ErrorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "event " << event.event_id << " " << event.exception.Type << ": " << event.exception.Message
                  << " span=" << event.trace.span_id.ToString() << std::endl;
    }

private:
    std::mutex mutex_;
};

static void handle_request(const tracebridge::ActivityListenerPtr& listener, const std::string& user_id) {
    auto request = std::make_shared<tracebridge::Activity>("Microsoft.AspNetCore.Hosting.HttpRequestIn",
                                                           tracebridge::TraceId{0x4bf92f3577b34da6, 0xa3ce929d0e0e4736},
                                                           tracebridge::SpanId{0x00f067aa0ba902b7 + std::hash<std::string>{}(user_id)});
    request->SetKind(tracebridge::ACTIVITY_KIND_SERVER);
    tracebridge::AddBaggageHeader(*request, "sentry-trace_id=" + request->GetTraceId().ToString() +
                                            ",sentry-public_key=public,sentry-sampled=true");
    listener->OnStart(request);

    auto query = std::make_shared<tracebridge::Activity>("Npgsql", tracebridge::TraceId{},
                                                         tracebridge::SpanId{0x1000 + std::hash<std::string>{}(user_id)});
    query->SetParent(request);
    query->SetKind(tracebridge::ACTIVITY_KIND_CLIENT);
    query->SetTag(tracebridge::semconv::DB_SYSTEM, std::string("postgresql"));
    query->SetTag(tracebridge::semconv::DB_STATEMENT, std::string("SELECT * FROM users WHERE id = $1"));
    listener->OnStart(query);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    query->SetDuration(std::chrono::milliseconds(5));
    listener->OnEnd(query);

    request->SetTag(tracebridge::semconv::HTTP_METHOD, std::string("GET"));
    request->SetTag(tracebridge::semconv::HTTP_ROUTE, std::string("/users/{id}"));
    if (user_id == "missing") {
        request->SetStatus(tracebridge::ACTIVITY_STATUS_ERROR);
        request->SetTag(tracebridge::semconv::HTTP_STATUS_CODE, int64_t{404});
        request->AddEvent(tracebridge::ActivityEvent{
            tracebridge::semconv::EXCEPTION_EVENT_NAME, std::chrono::system_clock::now(),
            {{tracebridge::semconv::EXCEPTION_TYPE, std::string("KeyNotFoundException")},
             {tracebridge::semconv::EXCEPTION_MESSAGE, std::string("user not found")}}});
    } else {
        request->SetTag(tracebridge::semconv::HTTP_STATUS_CODE, int64_t{200});
    }
    request->SetDuration(std::chrono::milliseconds(12));
    listener->OnEnd(request);
}

int main() {
    setenv("TRACEBRIDGE_DSN", "https://public@o1.ingest.example.com/42", 0);
    setenv("TRACEBRIDGE_LOG_LEVEL", "debug", 0);

    auto hub = tracebridge::CreateHub(std::make_shared<StdoutTransport>());
    if (!hub->Enable()) {
        std::cerr << "tracing is disabled" << std::endl;
        return 1;
    }

    tracebridge::ActivityListenerPtr listener;
    try {
        listener = tracebridge::NewActivityListener(hub,
            [](const tracebridge::SpanPtr& span, const tracebridge::Activity& activity) {
                span->SetExtra("handled.by", std::string("tutorial"));
            },
            []() {
                return tracebridge::AttributeDict{{"service.name", std::string("cpp-tutorial")}};
            });
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::thread worker([&listener]() { handle_request(listener, "alice"); });
    handle_request(listener, "missing");
    worker.join();

    hub->Shutdown();
    return 0;
}
