#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace jobsrv::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

constexpr std::uint32_t kDefaultExportIntervalMs = 1000;

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> job_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dispatches;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   live_workers_gauge;

  std::atomic<std::int64_t> live_workers{0};
};

bool InitializeMetrics(const jobsrv::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = OtlpEndpoint(config, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  options.use_ssl_credentials = false;
  auto exporter               = otlp::OtlpGrpcMetricExporterFactory::Create(options);

  const auto interval_ms = config.observability().metrics_interval_ms() > 0 ? config.observability().metrics_interval_ms() : kDefaultExportIntervalMs;
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", ServiceName(config)}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("jobsrv", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("jobsrv.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("jobsrv.request.latency_ms", "End-to-end request latency", "ms");
  impl_->job_transitions    = impl_->meter->CreateUInt64Counter("jobsrv.job.transitions", "Committed job state transitions", "1");
  impl_->dispatches         = impl_->meter->CreateUInt64Counter("jobsrv.dispatch.count", "Dispatch attempts by outcome", "1");
  impl_->live_workers_gauge = impl_->meter->CreateInt64ObservableGauge("jobsrv.workers.live", "Workers with a fresh heartbeat", "1");
  impl_->live_workers_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->live_workers.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  impl_->request_count->Add(1, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordJobTransition(std::string_view state, std::uint64_t count) {
  if (!impl_ || !impl_->job_transitions) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"state", std::string(state)}};
  impl_->job_transitions->Add(count, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordDispatch(std::string_view outcome) {
  if (!impl_ || !impl_->dispatches) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  impl_->dispatches->Add(1, attributes, opentelemetry::context::Context{});
}

void Metrics::SetLiveWorkers(std::int64_t count) {
  if (impl_) {
    impl_->live_workers.store(count);
  }
}

} // namespace jobsrv::observability

#endif
