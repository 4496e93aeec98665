#pragma once
#include "logfirecpp/telemetry/span_record.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace logfirecpp::telemetry
{

enum class ExportResult
{
    Success,
    Failure
};

/// Ships batches of finished records somewhere. Implementations may throw
/// TransportError; callers treat a throw like ExportResult::Failure.
class SpanExporter
{
  public:
    virtual ~SpanExporter() = default;
    virtual ExportResult export_spans(const std::vector<SpanRecord>& batch) = 0;
    virtual void shutdown() {}
};

/// Consumer of finished records. Each record is handed to each processor exactly once.
class SpanProcessor
{
  public:
    virtual ~SpanProcessor() = default;
    virtual void on_end(const SpanRecord& record) = 0;
    virtual bool force_flush(std::chrono::milliseconds timeout) = 0;
    virtual void shutdown(std::chrono::milliseconds timeout) = 0;
};

/// Exports every record synchronously on the producing thread.
class SimpleSpanProcessor : public SpanProcessor
{
  public:
    explicit SimpleSpanProcessor(std::shared_ptr<SpanExporter> exporter);

    void on_end(const SpanRecord& record) override;
    bool force_flush(std::chrono::milliseconds timeout) override;
    void shutdown(std::chrono::milliseconds timeout) override;

  private:
    std::shared_ptr<SpanExporter> exporter_;
    std::mutex mutex_;
    bool shut_down_{false};
};

class InMemorySpanExporter : public SpanExporter
{
  public:
    ExportResult export_spans(const std::vector<SpanRecord>& batch) override;
    std::vector<SpanRecord> finished_spans() const;
    void reset();

  private:
    mutable std::mutex mutex_;
    std::vector<SpanRecord> spans_;
};

} // namespace logfirecpp::telemetry
