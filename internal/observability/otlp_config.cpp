#include "internal/observability/spans.hpp"

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace dashstream::observability {

namespace cfg = dashstream::runtime::config;

OtlpConfig OtlpConfigFrom(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == cfg::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  std::string signal_env = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    signal_env.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  signal_env += "_ENDPOINT";

  if (const char* endpoint = std::getenv(signal_env.c_str()); endpoint && *endpoint) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); endpoint && *endpoint) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  return "localhost:4317";
}

} // namespace dashstream::observability
