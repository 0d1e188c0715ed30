#pragma once

#include <string>

namespace ReelSync {
namespace telemetry {

// Install an OTLP/gRPC tracer provider so tracing::Span also exports spans.
// serviceName becomes resource service.name; the endpoint comes from OTEL_EXPORTER_OTLP_ENDPOINT.
// Returns false when the build has no OpenTelemetry support or the exporter could not be created.
bool initialize(const std::string& serviceName);

// Flush pending spans and restore the no-op provider. Safe to call when not initialized.
void shutdown();

} // namespace telemetry
} // namespace ReelSync
