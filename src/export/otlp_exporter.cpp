#include "logfirecpp/export/otlp_exporter.hpp"

#include "logfirecpp/constants.hpp"
#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/export/otlp_json.hpp"
#include "logfirecpp/logging.hpp"

#include <spdlog/spdlog.h>

namespace logfirecpp::exporting
{
namespace
{

void check_response(const HttpResponse& response, const std::string& endpoint)
{
    if (response.status < 200 || response.status >= 300)
        throw TransportError("HTTP error " + std::to_string(response.status) + " from " +
                             endpoint + (response.body.empty() ? "" : ": " + response.body));
}

} // namespace

Headers otlp_headers(const OtlpOptions& options)
{
    Headers headers;
    headers.emplace_back("User-Agent", std::string("logfirecpp/") + VERSION);
    if (!options.token.empty())
        headers.emplace_back("Authorization", options.token);
    for (const auto& h : options.extra_headers)
        headers.push_back(h);
    return headers;
}

std::string join_url(const std::string& base_url, const std::string& path)
{
    if (!base_url.empty() && base_url.back() == '/')
        return base_url.substr(0, base_url.size() - 1) + path;
    return base_url + path;
}

OtlpSpanExporter::OtlpSpanExporter(OtlpOptions options, std::shared_ptr<HttpTransport> transport)
    : options_(std::move(options)),
      transport_(transport ? std::move(transport)
                           : std::make_shared<HttpTransport>(std::make_shared<HttplibBackend>())),
      endpoint_(join_url(options_.base_url, TRACES_PATH))
{
}

telemetry::ExportResult
OtlpSpanExporter::export_spans(const std::vector<telemetry::SpanRecord>& batch)
{
    if (batch.empty())
        return telemetry::ExportResult::Success;
    export_payload(encode_spans(batch, options_.service_name).dump());
    logging::logger()->debug("Exported {} spans to {}", batch.size(), endpoint_);
    return telemetry::ExportResult::Success;
}

void OtlpSpanExporter::export_payload(const std::string& payload)
{
    auto response = transport_->post(endpoint_, payload, otlp_headers(options_));
    check_response(response, endpoint_);
}

OtlpMetricExporter::OtlpMetricExporter(OtlpOptions options,
                                       std::shared_ptr<HttpTransport> transport)
    : options_(std::move(options)),
      transport_(transport ? std::move(transport)
                           : std::make_shared<HttpTransport>(std::make_shared<HttplibBackend>())),
      endpoint_(join_url(options_.base_url, METRICS_PATH))
{
}

metrics::ExportResult
OtlpMetricExporter::export_metrics(const std::vector<metrics::MetricPoint>& points)
{
    auto payload = encode_metrics(points, options_.service_name).dump();
    auto response = transport_->post(endpoint_, std::move(payload), otlp_headers(options_));
    check_response(response, endpoint_);
    return metrics::ExportResult::Success;
}

} // namespace logfirecpp::exporting
