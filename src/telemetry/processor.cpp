#include "logfirecpp/telemetry/processor.hpp"

#include "logfirecpp/logging.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace logfirecpp::telemetry
{

SimpleSpanProcessor::SimpleSpanProcessor(std::shared_ptr<SpanExporter> exporter)
    : exporter_(std::move(exporter))
{
    if (!exporter_)
        throw std::invalid_argument("SimpleSpanProcessor requires an exporter");
}

void SimpleSpanProcessor::on_end(const SpanRecord& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_)
    {
        logging::logger()->warn("Span '{}' ended after processor shutdown", record.name);
        return;
    }
    try
    {
        if (exporter_->export_spans({record}) == ExportResult::Failure)
            logging::logger()->warn("Exporter failed to export span '{}'", record.name);
    }
    catch (const std::exception& e)
    {
        logging::logger()->error("Exception while exporting span '{}': {}", record.name, e.what());
    }
}

bool SimpleSpanProcessor::force_flush(std::chrono::milliseconds /*timeout*/)
{
    return true;
}

void SimpleSpanProcessor::shutdown(std::chrono::milliseconds /*timeout*/)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_)
        return;
    shut_down_ = true;
    exporter_->shutdown();
}

ExportResult InMemorySpanExporter::export_spans(const std::vector<SpanRecord>& batch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.insert(spans_.end(), batch.begin(), batch.end());
    return ExportResult::Success;
}

std::vector<SpanRecord> InMemorySpanExporter::finished_spans() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

void InMemorySpanExporter::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.clear();
}

} // namespace logfirecpp::telemetry
