#include "logfirecpp/export/fallback_exporter.hpp"

#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/logging.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace logfirecpp::exporting
{

FallbackSpanExporter::FallbackSpanExporter(std::shared_ptr<telemetry::SpanExporter> primary,
                                           std::shared_ptr<telemetry::SpanExporter> fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback))
{
    if (!primary_ || !fallback_)
        throw std::invalid_argument("FallbackSpanExporter requires both exporters");
}

telemetry::ExportResult
FallbackSpanExporter::export_spans(const std::vector<telemetry::SpanRecord>& batch)
{
    try
    {
        if (primary_->export_spans(batch) == telemetry::ExportResult::Success)
            return telemetry::ExportResult::Success;
        logging::logger()->warn("Primary exporter failed for {} spans, writing to fallback",
                                batch.size());
    }
    catch (const BodyTooLargeError& e)
    {
        logging::logger()->warn("{} Writing {} spans to fallback", e.what(), batch.size());
    }
    catch (const std::exception& e)
    {
        logging::logger()->warn("Primary exporter raised for {} spans ({}), writing to fallback",
                                batch.size(), e.what());
    }
    return write_fallback(batch);
}

telemetry::ExportResult
FallbackSpanExporter::write_fallback(const std::vector<telemetry::SpanRecord>& batch)
{
    try
    {
        auto result = fallback_->export_spans(batch);
        if (result == telemetry::ExportResult::Success)
        {
            fallback_count_.fetch_add(1);
            return telemetry::ExportResult::Success;
        }
        logging::logger()->error("Fallback exporter failed, {} spans lost", batch.size());
    }
    catch (const std::exception& e)
    {
        logging::logger()->error("Fallback exporter raised, {} spans lost: {}", batch.size(),
                                 e.what());
    }
    return telemetry::ExportResult::Failure;
}

void FallbackSpanExporter::shutdown()
{
    primary_->shutdown();
    fallback_->shutdown();
}

} // namespace logfirecpp::exporting
