#pragma once
#include "logfirecpp/export/http_transport.hpp"
#include "logfirecpp/metrics/meter.hpp"
#include "logfirecpp/telemetry/processor.hpp"

#include <memory>
#include <string>

namespace logfirecpp::exporting
{

struct OtlpOptions
{
    std::string base_url{"https://api.logfire.dev"};
    /// Sent verbatim as the Authorization header; omitted when empty.
    std::string token;
    std::string service_name{"unknown_service"};
    Headers extra_headers;
};

/// Request headers shared by the trace and metric exporters.
Headers otlp_headers(const OtlpOptions& options);

/// Joins `base_url` and an absolute path without doubling the slash.
std::string join_url(const std::string& base_url, const std::string& path);

/// Posts OTLP JSON to `<base_url>/v1/traces`. One attempt per batch; a non-2xx
/// response or a transport failure throws TransportError.
class OtlpSpanExporter : public telemetry::SpanExporter
{
  public:
    OtlpSpanExporter(OtlpOptions options, std::shared_ptr<HttpTransport> transport);

    telemetry::ExportResult export_spans(const std::vector<telemetry::SpanRecord>& batch) override;

    /// Posts an already-encoded payload (used to replay the fallback store).
    void export_payload(const std::string& payload);

    const std::string& endpoint() const
    {
        return endpoint_;
    }

  private:
    OtlpOptions options_;
    std::shared_ptr<HttpTransport> transport_;
    std::string endpoint_;
};

/// Posts OTLP JSON metrics to `<base_url>/v1/metrics`.
class OtlpMetricExporter : public metrics::MetricExporter
{
  public:
    OtlpMetricExporter(OtlpOptions options, std::shared_ptr<HttpTransport> transport);

    metrics::ExportResult export_metrics(const std::vector<metrics::MetricPoint>& points) override;

  private:
    OtlpOptions options_;
    std::shared_ptr<HttpTransport> transport_;
    std::string endpoint_;
};

} // namespace logfirecpp::exporting
