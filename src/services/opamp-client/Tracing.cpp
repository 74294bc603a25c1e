#include "Tracing.hpp"

#include <iomanip>
#include <random>
#include <sstream>

#if OPAMP_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kInstrumentationName = "opamp-client";

std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

#if OPAMP_ENABLE_OTEL
std::string TraceParentOf(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return NewTraceParent();
    }

    char traceId[32];
    char spanId[16];
    context.trace_id().ToLowerBase16(traceId);
    context.span_id().ToLowerBase16(spanId);
    return "00-" + std::string(traceId, sizeof(traceId)) + "-" + std::string(spanId, sizeof(spanId))
        + (context.trace_flags().IsSampled() ? "-01" : "-00");
}
#endif
} // namespace

const char* SpanName(ExchangeKind kind) {
    switch (kind) {
        case ExchangeKind::Report: return "opamp.exchange";
        case ExchangeKind::Disconnect: return "opamp.disconnect";
    }
    return "opamp.unknown";
}

std::string NewTraceParent() {
    return "00-" + RandomHex(16) + "-" + RandomHex(8) + "-01";
}

void ExchangeSpan::RecordHttpStatus(long statusCode) {
#if OPAMP_ENABLE_OTEL
    if (span_ && !finished_) {
        span_->SetAttribute("http.response.status_code", static_cast<int64_t>(statusCode));
    }
#else
    (void)statusCode;
#endif
}

void ExchangeSpan::Finish(bool success, const std::string& errorType) {
    if (finished_) {
        return;
    }
    finished_ = true;
#if OPAMP_ENABLE_OTEL
    if (span_) {
        if (success) {
            span_->SetStatus(opentelemetry::trace::StatusCode::kOk);
        } else {
            if (!errorType.empty()) {
                span_->SetAttribute("error.type", errorType);
            }
            span_->SetStatus(opentelemetry::trace::StatusCode::kError, errorType);
        }
        span_->End();
    }
#else
    (void)success;
    (void)errorType;
#endif
}

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if OPAMP_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(
        std::move(exporter), opentelemetry::sdk::trace::BatchSpanProcessorOptions());
    auto resource = opentelemetry::sdk::resource::Resource::Create({
        {"service.name", config.serviceName.empty() ? std::string(kInstrumentationName) : config.serviceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(provider_));
    tracer_ = provider_->GetTracer(kInstrumentationName);
    enabled_ = true;
#else
    (void)kInstrumentationName;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

ExchangeSpan Tracer::StartExchange(const ExchangeAttributes& attributes) {
    ExchangeSpan span;
#if OPAMP_ENABLE_OTEL
    if (enabled_ && tracer_) {
        opentelemetry::trace::StartSpanOptions options;
        options.kind = opentelemetry::trace::SpanKind::kClient;
        span.span_ = tracer_->StartSpan(SpanName(attributes.kind), options);
        span.span_->SetAttribute("opamp.sequence_num", static_cast<int64_t>(attributes.sequenceNum));
        span.span_->SetAttribute("opamp.attempt", static_cast<int64_t>(attributes.attempt));
        span.span_->SetAttribute("opamp.heartbeat", attributes.heartbeat);
        span.span_->SetAttribute("opamp.message_bytes", static_cast<int64_t>(attributes.bodyBytes));
        if (!attributes.instanceUid.empty()) {
            span.span_->SetAttribute("service.instance.id", attributes.instanceUid);
        }
        span.traceparent_ = TraceParentOf(span.span_->GetContext());
        return span;
    }
#else
    (void)attributes;
#endif

    span.traceparent_ = NewTraceParent();
    return span;
}

void Tracer::Shutdown() {
#if OPAMP_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
    enabled_ = false;
}
