#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace market::runtime::config {
class RuntimeConfig;
}

namespace market::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"market-core"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Exporter settings shared by the trace and metric pipelines.
OtlpConfig OtlpConfigFrom(const market::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const market::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const market::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// W3C trace context of the active span as (header, value) pairs, for
// outgoing calls to workers and collaborators. Empty without an active span.
using TraceHeaders = std::vector<std::pair<std::string, std::string>>;
TraceHeaders CurrentTraceHeaders();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // Discovery
  void SetWorkerCounts(std::uint64_t registered, std::uint64_t online);
  void ObserveDiscoveryLatencyMs(double latency_ms);

  // Auctions
  void RecordAuctionCreated(std::string_view kind);
  void RecordBidReceived();
  void RecordAuctionResolved(std::string_view status);
  void ObserveWinningPrice(double price);

  // Ledger
  void RecordChannelOpened();
  void RecordChannelClosed();
  void AddEscrowLocked(std::int64_t micros);
  void AddEscrowReleased(std::int64_t micros, bool success);
  void RecordInvariantViolation();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const market::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const market::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline TraceHeaders CurrentTraceHeaders() {
  return {};
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::SetWorkerCounts(std::uint64_t, std::uint64_t) {
}

inline void Metrics::ObserveDiscoveryLatencyMs(double) {
}

inline void Metrics::RecordAuctionCreated(std::string_view) {
}

inline void Metrics::RecordBidReceived() {
}

inline void Metrics::RecordAuctionResolved(std::string_view) {
}

inline void Metrics::ObserveWinningPrice(double) {
}

inline void Metrics::RecordChannelOpened() {
}

inline void Metrics::RecordChannelClosed() {
}

inline void Metrics::AddEscrowLocked(std::int64_t) {
}

inline void Metrics::AddEscrowReleased(std::int64_t, bool) {
}

inline void Metrics::RecordInvariantViolation() {
}
#endif

} // namespace market::observability
