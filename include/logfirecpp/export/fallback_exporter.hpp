#pragma once
#include "logfirecpp/telemetry/processor.hpp"

#include <atomic>
#include <cstddef>
#include <memory>

namespace logfirecpp::exporting
{

/// Sends through `primary`; when it fails or throws, writes the batch to
/// `fallback` instead and reports success. Failures are logged, never raised.
class FallbackSpanExporter : public telemetry::SpanExporter
{
  public:
    FallbackSpanExporter(std::shared_ptr<telemetry::SpanExporter> primary,
                         std::shared_ptr<telemetry::SpanExporter> fallback);

    telemetry::ExportResult export_spans(const std::vector<telemetry::SpanRecord>& batch) override;
    void shutdown() override;

    /// Batches diverted to the fallback so far.
    std::size_t fallback_count() const
    {
        return fallback_count_.load();
    }

  private:
    telemetry::ExportResult write_fallback(const std::vector<telemetry::SpanRecord>& batch);

    std::shared_ptr<telemetry::SpanExporter> primary_;
    std::shared_ptr<telemetry::SpanExporter> fallback_;
    std::atomic<std::size_t> fallback_count_{0};
};

} // namespace logfirecpp::exporting
