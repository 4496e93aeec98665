#pragma once
#include "logfirecpp/export/http_transport.hpp"
#include "logfirecpp/metrics/meter.hpp"
#include "logfirecpp/settings.hpp"
#include "logfirecpp/telemetry/id_generator.hpp"
#include "logfirecpp/telemetry/processor.hpp"
#include "logfirecpp/telemetry/provider.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace logfirecpp
{

/// Collaborators injected at configure() time. Unset members use the defaults.
struct ConfigureOptions
{
    std::shared_ptr<telemetry::IdGenerator> id_generator;
    telemetry::TimestampSource timestamp;
    /// Receive the same finished records as the network exporter.
    std::vector<std::shared_ptr<telemetry::SpanProcessor>> additional_span_processors;
    /// Replaces the OTLP span exporter as the primary; still wrapped by the fallback.
    std::shared_ptr<telemetry::SpanExporter> span_exporter;
    std::shared_ptr<exporting::HttpBackend> http_backend;
    /// Each gets its own periodic reader.
    std::vector<std::shared_ptr<metrics::MetricExporter>> metric_exporters;
    /// Batch the primary exporter in the background (true) or export synchronously.
    bool batch_spans{true};
};

/// Validates `config`, builds tracer and meter providers and installs them
/// process-wide. A previous configuration is shut down first.
/// Throws ConfigurationError.
void configure(const LogfireConfig& config, ConfigureOptions options = {});

std::shared_ptr<telemetry::TracerProvider> tracer_provider();
std::shared_ptr<metrics::MeterProvider> meter_provider();

bool force_flush(std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});

/// Flushes and stops the installed providers and metric readers.
void shutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});

} // namespace logfirecpp
