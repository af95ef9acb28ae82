#pragma once

#include <string>
#include <utility>
#include <vector>

namespace ledger::runtime::config {
class RuntimeConfig;
}

namespace ledger::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpSettings {
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          use_tls{false};
};

// Endpoint precedence: config, then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT,
// then OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
// An https:// endpoint turns TLS on for the grpc exporter.
OtlpSettings ResolveOtlpSettings(const ledger::runtime::config::RuntimeConfig& config, OtlpSignal signal);

// service.name, service.instance.id and deployment.environment for every exporter.
std::vector<std::pair<std::string, std::string>> ResourceAttributes();

} // namespace ledger::observability
