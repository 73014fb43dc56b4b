#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "config/config.pb.h"

namespace credit::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

using credit::runtime::config::ObservabilityConfig;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const ObservabilityConfig& config) {
  if (config.transport() == credit::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    if (!config.otlp_endpoint().empty()) {
      options.url = config.otlp_endpoint();
    }
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  // Empty endpoint keeps the exporter default, which honours OTEL_EXPORTER_OTLP_*.
  otlp::OtlpGrpcExporterOptions options;
  if (!config.otlp_endpoint().empty()) {
    options.endpoint = config.otlp_endpoint();
  }
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const credit::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(BuildExporter(config.observability()), sdktrace::BatchSpanProcessorOptions{});
  const opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", "credit-ledger"}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attributes);

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer("credit-ledger");
  return true;
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
    g_provider.reset();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view operation) {
  if (!g_tracer) {
    return;
  }
  impl_        = std::make_unique<Impl>();
  impl_->span  = g_tracer->StartSpan(std::string(operation));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetOutcome(std::string_view outcome, std::string_view message) {
  if (!impl_) {
    return;
  }
  impl_->span->SetAttribute("credit.outcome", std::string(outcome));
  if (outcome != "ok") {
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(message));
  }
}

} // namespace credit::observability

#endif
