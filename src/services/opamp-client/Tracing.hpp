#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if OPAMP_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

enum class ExchangeKind {
    Report,
    Disconnect
};

// What is known about an AgentToServer message before it is posted.
struct ExchangeAttributes {
    ExchangeKind kind = ExchangeKind::Report;
    uint64_t sequenceNum = 0;
    // 1 for the first try of a message, counting up across retries.
    int attempt = 1;
    bool heartbeat = false;
    std::string instanceUid;
    size_t bodyBytes = 0;
};

// Span around one POST to the OpAMP server. The traceparent is always
// valid so the server can correlate requests even without an exporter.
class ExchangeSpan {
public:
    const std::string& TraceParent() const { return traceparent_; }
    bool Finished() const { return finished_; }

    void RecordHttpStatus(long statusCode);
    // Ends the span; a second call is a no-op.
    void Finish(bool success, const std::string& errorType = std::string());

private:
    friend class Tracer;

    std::string traceparent_;
    bool finished_ = false;
#if OPAMP_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span_;
#endif
};

class Tracer {
public:
    static Tracer& Instance();

    // Must run before the client starts its poll thread.
    void Configure(const TraceConfig& config);
    bool Enabled() const;

    ExchangeSpan StartExchange(const ExchangeAttributes& attributes);
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if OPAMP_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

const char* SpanName(ExchangeKind kind);

// W3C traceparent with fresh random ids, sampled.
std::string NewTraceParent();
