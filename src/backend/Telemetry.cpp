#include "Telemetry.h"
#include "utils/DebugLogger.h"

#include <cstdlib>
#include <mutex>

#if defined(REELSYNC_ENABLE_TRACING)

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

namespace {
namespace sdktrace = opentelemetry::sdk::trace;
std::shared_ptr<sdktrace::TracerProvider> g_provider;
std::mutex g_providerMutex;
}

namespace ReelSync {
namespace telemetry {

bool initialize(const std::string& serviceName) {
    const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT");
    // 4317 is the OTLP/gRPC default
    std::string endpoint = env ? env : "http://localhost:4317";

    std::lock_guard<std::mutex> lock(g_providerMutex);
    if (g_provider) {
        logDebug("Telemetry already initialized, skipping re-initialization");
        return true;
    }

    try {
        opentelemetry::exporters::otlp::OtlpGrpcExporterOptions options;
        options.endpoint = endpoint;
        auto exporter = std::unique_ptr<sdktrace::SpanExporter>(
            new opentelemetry::exporters::otlp::OtlpGrpcExporter(options));
        auto processor = std::unique_ptr<sdktrace::SpanProcessor>(
            new sdktrace::BatchSpanProcessor(std::move(exporter)));

        auto resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", serviceName}});
        auto provider = std::make_shared<sdktrace::TracerProvider>(std::move(processor), resource);

        opentelemetry::trace::Provider::SetTracerProvider(
            opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(provider));
        g_provider = provider;
        logInfo("Telemetry initialized (OTLP endpoint=" + endpoint + ", service=" + serviceName + ")");
        return true;
    } catch (const std::exception& e) {
        logError(std::string("Failed to initialize telemetry: ") + e.what());
        return false;
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_providerMutex);
    if (!g_provider) {
        return;
    }
    if (!g_provider->Shutdown()) {
        logWarn("Telemetry shutdown failed (Shutdown() returned false)");
    }
    opentelemetry::trace::Provider::SetTracerProvider(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(
            new opentelemetry::trace::NoopTracerProvider()));
    g_provider.reset();
    logInfo("Telemetry shutdown");
}

} // namespace telemetry
} // namespace ReelSync

#else

namespace ReelSync {
namespace telemetry {

bool initialize(const std::string& serviceName) {
    (void)serviceName;
    logDebug("Telemetry not enabled in this build");
    return false;
}

void shutdown() {
}

} // namespace telemetry
} // namespace ReelSync

#endif
