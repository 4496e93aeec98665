#include "logfirecpp/config.hpp"

#include "logfirecpp/export/fallback_exporter.hpp"
#include "logfirecpp/export/file_exporter.hpp"
#include "logfirecpp/export/otlp_exporter.hpp"
#include "logfirecpp/logging.hpp"
#include "logfirecpp/metrics/periodic_reader.hpp"
#include "logfirecpp/telemetry/batch_processor.hpp"

#include <mutex>
#include <spdlog/spdlog.h>

namespace logfirecpp
{
namespace
{

struct Installed
{
    std::shared_ptr<telemetry::TracerProvider> tracer;
    std::shared_ptr<metrics::MeterProvider> meter;
    std::vector<std::unique_ptr<metrics::PeriodicMetricReader>> readers;
};

std::mutex& state_mutex()
{
    static std::mutex m;
    return m;
}

Installed& installed()
{
    static Installed state;
    return state;
}

void shutdown_locked(Installed& state, std::chrono::milliseconds timeout)
{
    if (state.tracer)
        state.tracer->shutdown(timeout);
    for (auto& reader : state.readers)
        reader->shutdown();
    state.readers.clear();
}

exporting::OtlpOptions otlp_options(const LogfireConfig& config)
{
    exporting::OtlpOptions o;
    o.base_url = config.base_url;
    o.token = config.token;
    o.service_name = config.service_name;
    o.extra_headers = config.request_headers;
    return o;
}

std::shared_ptr<telemetry::SpanExporter> build_span_exporter(
    const LogfireConfig& config, const ConfigureOptions& options,
    const std::shared_ptr<exporting::HttpTransport>& transport)
{
    if (config.traces_exporter == "none")
        return nullptr;

    std::shared_ptr<telemetry::SpanExporter> primary = options.span_exporter;
    if (!primary && config.send_to_logfire)
        primary = std::make_shared<exporting::OtlpSpanExporter>(otlp_options(config), transport);
    if (!primary)
        return nullptr;

    if (config.exporter_fallback_file_path.empty())
        return primary;
    auto fallback = std::make_shared<exporting::FileSpanExporter>(
        config.exporter_fallback_file_path, config.service_name);
    return std::make_shared<exporting::FallbackSpanExporter>(primary, fallback);
}

} // namespace

void configure(const LogfireConfig& config, ConfigureOptions options)
{
    config.validate();
    logging::set_level(config.log_level);

    auto backend = options.http_backend
                       ? options.http_backend
                       : std::make_shared<exporting::HttplibBackend>(
                             std::chrono::milliseconds{config.export_timeout_ms});
    auto transport = std::make_shared<exporting::HttpTransport>(
        backend, static_cast<std::size_t>(config.max_body_size));

    auto tracer = std::make_shared<telemetry::TracerProvider>(options.id_generator,
                                                              options.timestamp);
    if (auto exporter = build_span_exporter(config, options, transport))
    {
        if (options.batch_spans)
        {
            telemetry::BatchOptions batch;
            batch.schedule_delay = std::chrono::milliseconds{config.schedule_delay_ms};
            batch.max_queue_size = static_cast<size_t>(config.max_queue_size);
            batch.max_export_batch_size = static_cast<size_t>(config.max_export_batch_size);
            tracer->add_span_processor(
                std::make_shared<telemetry::BatchSpanProcessor>(exporter, batch));
        }
        else
        {
            tracer->add_span_processor(std::make_shared<telemetry::SimpleSpanProcessor>(exporter));
        }
    }
    for (auto& processor : options.additional_span_processors)
        tracer->add_span_processor(processor);

    auto meter = std::make_shared<metrics::MeterProvider>(
        options.timestamp ? options.timestamp : telemetry::TimestampSource(telemetry::now_ns));
    auto metric_exporters = options.metric_exporters;
    if (config.send_to_logfire)
        metric_exporters.push_back(
            std::make_shared<exporting::OtlpMetricExporter>(otlp_options(config), transport));

    std::lock_guard<std::mutex> lock(state_mutex());
    auto& state = installed();
    shutdown_locked(state, std::chrono::milliseconds{config.export_timeout_ms});

    state.tracer = tracer;
    state.meter = meter;
    for (auto& exporter : metric_exporters)
        state.readers.push_back(std::make_unique<metrics::PeriodicMetricReader>(
            meter, exporter, std::chrono::milliseconds{config.metric_export_interval_ms}));

    telemetry::set_global_provider(tracer);
    metrics::set_global_meter_provider(meter);
    logging::logger()->debug("Configured service '{}' ({} span processors, {} metric readers)",
                             config.service_name, tracer->processors().size(),
                             state.readers.size());
}

std::shared_ptr<telemetry::TracerProvider> tracer_provider()
{
    return telemetry::global_provider();
}

std::shared_ptr<metrics::MeterProvider> meter_provider()
{
    return metrics::global_meter_provider();
}

bool force_flush(std::chrono::milliseconds timeout)
{
    bool ok = telemetry::global_provider()->force_flush(timeout);
    std::lock_guard<std::mutex> lock(state_mutex());
    for (auto& reader : installed().readers)
        ok = reader->force_flush() && ok;
    return ok;
}

void shutdown(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(state_mutex());
    shutdown_locked(installed(), timeout);
}

} // namespace logfirecpp
