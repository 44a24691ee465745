#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define MARKET_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define MARKET_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace market::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool market_metrics_enabled{true};
  bool route_labels_enabled{true};
};

MetricsOptions g_metrics_options;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;

  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> workers_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>    discovery_latency_ms;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> auctions_created;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> bids_received;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> auctions_resolved;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      winning_price;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> channels_opened;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> channels_closed;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> escrow_locked_micros;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> escrow_released_micros;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> invariant_violations;

  std::mutex   workers_mutex;
  std::int64_t workers_registered{0};
  std::int64_t workers_online{0};
};

namespace {

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

void InstallProvider(const OtlpConfig& config, const sdkmetrics::PeriodicExportingMetricReaderOptions& reader_options) {
  auto exporter = BuildExporter(config);
#ifdef MARKET_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
}

} // namespace

bool InitializeMetrics(const market::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = OtlpConfigFrom(config);

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  InstallProvider(otlp_config, reader_options);

  g_metrics_options.request_metrics_enabled = metric_config.request_metrics_enabled();
  g_metrics_options.market_metrics_enabled  = metric_config.market_metrics_enabled();
  g_metrics_options.route_labels_enabled    = metric_config.route_labels_enabled();

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
  impl_->meter  = provider->GetMeter("market-core", "0.1.0");

  auto& m = *impl_->meter;
  impl_->request_count      = m.CreateUInt64Counter("market.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = m.CreateDoubleHistogram("market.request.latency_ms", "End-to-end request latency in milliseconds", "ms");

  impl_->discovery_latency_ms = m.CreateDoubleHistogram("market.discovery.latency_ms", "Capability index query latency", "ms");
  impl_->workers_gauge        = m.CreateInt64ObservableGauge("market.workers", "Registered and online workers", "1");
  impl_->workers_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->workers_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        const std::initializer_list<AttributePair> registered = {{"state", "registered"}};
        const std::initializer_list<AttributePair> online     = {{"state", "online"}};
        int_result->Observe(impl->workers_registered, registered);
        int_result->Observe(impl->workers_online, online);
      },
      impl_.get());

  impl_->auctions_created  = m.CreateUInt64Counter("market.auctions.created", "Auctions opened", "1");
  impl_->bids_received     = m.CreateUInt64Counter("market.auctions.bids", "Bids accepted", "1");
  impl_->auctions_resolved = m.CreateUInt64Counter("market.auctions.resolved", "Auctions reaching a terminal state", "1");
  impl_->winning_price     = m.CreateDoubleHistogram("market.auctions.winning_price", "Clearing price of awarded auctions", "1");

  impl_->channels_opened        = m.CreateUInt64Counter("market.ledger.channels_opened", "Payment channels opened", "1");
  impl_->channels_closed        = m.CreateUInt64Counter("market.ledger.channels_closed", "Payment channels closed", "1");
  impl_->escrow_locked_micros   = m.CreateUInt64Counter("market.ledger.escrow_locked", "Escrow locked in micro-units", "1");
  impl_->escrow_released_micros = m.CreateUInt64Counter("market.ledger.escrow_released", "Escrow released or refunded in micro-units", "1");
  impl_->invariant_violations   = m.CreateUInt64Counter("market.ledger.invariant_violations", "Ledger invariant violations; must stay zero", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetWorkerCounts(std::uint64_t registered, std::uint64_t online) {
  if (!impl_ || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->workers_mutex);
  impl_->workers_registered = static_cast<std::int64_t>(registered);
  impl_->workers_online     = static_cast<std::int64_t>(online);
}

void Metrics::ObserveDiscoveryLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->discovery_latency_ms || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  RecordWithAttributes(impl_->discovery_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordAuctionCreated(std::string_view kind) {
  if (!impl_ || !impl_->auctions_created || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->auctions_created, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordBidReceived() {
  if (!impl_ || !impl_->bids_received || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  AddWithAttributes(impl_->bids_received, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordAuctionResolved(std::string_view status) {
  if (!impl_ || !impl_->auctions_resolved || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  AddWithAttributes(impl_->auctions_resolved, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveWinningPrice(double price) {
  if (!impl_ || !impl_->winning_price || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  RecordWithAttributes(impl_->winning_price, price, std::initializer_list<AttributePair>{});
}

void Metrics::RecordChannelOpened() {
  if (!impl_ || !impl_->channels_opened || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  AddWithAttributes(impl_->channels_opened, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::RecordChannelClosed() {
  if (!impl_ || !impl_->channels_closed || !g_metrics_options.market_metrics_enabled) {
    return;
  }
  AddWithAttributes(impl_->channels_closed, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

void Metrics::AddEscrowLocked(std::int64_t micros) {
  if (!impl_ || !impl_->escrow_locked_micros || !g_metrics_options.market_metrics_enabled || micros <= 0) {
    return;
  }
  AddWithAttributes(impl_->escrow_locked_micros, static_cast<std::uint64_t>(micros), std::initializer_list<AttributePair>{});
}

void Metrics::AddEscrowReleased(std::int64_t micros, bool success) {
  if (!impl_ || !impl_->escrow_released_micros || !g_metrics_options.market_metrics_enabled || micros <= 0) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", success ? "settled" : "refunded"}};
  AddWithAttributes(impl_->escrow_released_micros, static_cast<std::uint64_t>(micros), attributes);
}

// Not gated by market_metrics_enabled.
void Metrics::RecordInvariantViolation() {
  if (!impl_ || !impl_->invariant_violations) {
    return;
  }
  AddWithAttributes(impl_->invariant_violations, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

} // namespace market::observability

#endif
