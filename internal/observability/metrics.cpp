#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace credit::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

using credit::runtime::config::ObservabilityConfig;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const ObservabilityConfig& config) {
  if (config.transport() == credit::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    if (!config.otlp_endpoint().empty()) {
      options.url = config.otlp_endpoint();
    }
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  if (!config.otlp_endpoint().empty()) {
    options.endpoint = config.otlp_endpoint();
  }
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// Older API releases take no Context argument on synchronous instruments.
template <typename Instrument, typename Value>
void Emit(Instrument& instrument, Value value, Attributes attributes) {
  if constexpr (requires { instrument.Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument.Add(value, attributes, opentelemetry::context::Context{});
  } else if constexpr (requires { instrument.Add(value, attributes); }) {
    instrument.Add(value, attributes);
  } else if constexpr (requires { instrument.Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument.Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument.Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operations;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> disbursed_amount;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> loans_repaid;
};

bool InitializeMetrics(const credit::runtime::config::RuntimeConfig& config) {
  ShutdownMetrics();
  if (!config.observability().metrics_enabled()) {
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(config.observability()), reader_options);

  const opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", "credit-ledger"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           opentelemetry::sdk::resource::Resource::Create(attributes));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
    g_provider.reset();
  }
}

// Instruments bind to whichever provider is installed on first use; the
// factory initializes metrics before building the ledger.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("credit-ledger");

  impl_->operations           = impl_->meter->CreateUInt64Counter("credit.ledger.operations", "Ledger operations by outcome code", "1");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("credit.ledger.operation_latency_ms", "Ledger operation latency", "ms");
  impl_->disbursed_amount     = impl_->meter->CreateUInt64Counter("credit.loan.disbursed_amount", "Principal disbursed", "1");
  impl_->loans_repaid         = impl_->meter->CreateUInt64Counter("credit.loan.repaid", "Loans whose balance reached zero", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, std::string_view outcome) {
  const std::string op(operation);
  const std::string code(outcome);
  Emit(*impl_->operations, static_cast<std::uint64_t>(1), {{"operation", op}, {"outcome", code}});
}

void Metrics::ObserveOperationLatencyMs(std::string_view operation, double latency_ms) {
  const std::string op(operation);
  Emit(*impl_->operation_latency_ms, latency_ms, {{"operation", op}});
}

void Metrics::AddDisbursedAmount(std::uint64_t amount) {
  Emit(*impl_->disbursed_amount, amount, {});
}

void Metrics::RecordLoanRepaid() {
  Emit(*impl_->loans_repaid, static_cast<std::uint64_t>(1), {});
}

} // namespace credit::observability

#endif
