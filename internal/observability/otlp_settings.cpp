#include "internal/observability/otlp_settings.hpp"

#include <unistd.h>

#include <cstdlib>

#include "config/config.pb.h"

namespace ledger::observability {
namespace {

constexpr const char* kServiceName = "ledger-core";

const char* SignalEndpointEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(OtlpSignal signal, OtlpTransport transport) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

std::string InstanceId() {
  if (const char* id = std::getenv("LEDGER_INSTANCE_ID")) {
    return id;
  }
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    return std::string(host) + ":" + std::to_string(getpid());
  }
  return "pid-" + std::to_string(getpid());
}

} // namespace

OtlpSettings ResolveOtlpSettings(const ledger::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto&  observability = config.observability();
  OtlpSettings settings;
  settings.transport =
      observability.transport() == ledger::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEndpointEnv(signal))) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = DefaultEndpoint(signal, settings.transport);
  }

  settings.use_tls = settings.endpoint.rfind("https://", 0) == 0;
  return settings;
}

std::vector<std::pair<std::string, std::string>> ResourceAttributes() {
  std::vector<std::pair<std::string, std::string>> attrs;
  attrs.emplace_back("service.name", kServiceName);
  attrs.emplace_back("service.instance.id", InstanceId());
  if (const char* env = std::getenv("LEDGER_ENVIRONMENT")) {
    attrs.emplace_back("deployment.environment", env);
  }
  return attrs;
}

} // namespace ledger::observability
