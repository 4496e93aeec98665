#pragma once
#include "logfirecpp/telemetry/processor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace logfirecpp::telemetry
{

struct BatchOptions
{
    std::chrono::milliseconds schedule_delay{500};
    size_t max_queue_size{2048};
    size_t max_export_batch_size{512};
};

/// Queues finished records and exports them from one background worker, on
/// whichever comes first: the schedule delay elapsing or a full batch.
/// Producers never perform network I/O.
class BatchSpanProcessor : public SpanProcessor
{
  public:
    explicit BatchSpanProcessor(std::shared_ptr<SpanExporter> exporter, BatchOptions options = {});
    ~BatchSpanProcessor() override;

    BatchSpanProcessor(const BatchSpanProcessor&) = delete;
    BatchSpanProcessor& operator=(const BatchSpanProcessor&) = delete;

    void on_end(const SpanRecord& record) override;
    /// Blocks until everything queued before the call has been exported or `timeout` passes.
    bool force_flush(std::chrono::milliseconds timeout) override;
    /// Flushes (bounded by `timeout`), then drains the rest and stops the worker.
    /// Records arriving afterwards are exported on the caller.
    void shutdown(std::chrono::milliseconds timeout) override;

    size_t dropped_count() const
    {
        return dropped_.load();
    }
    const BatchOptions& options() const
    {
        return options_;
    }

  private:
    void worker_loop();
    void export_batch(const std::vector<SpanRecord>& batch);

    std::shared_ptr<SpanExporter> exporter_;
    BatchOptions options_;

    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable flushed_cv_;
    std::deque<SpanRecord> queue_;
    uint64_t flush_requested_{0};
    uint64_t flush_completed_{0};
    bool shutting_down_{false};
    bool stop_requested_{false};
    bool worker_exited_{false};
    bool overflow_reported_{false};

    std::mutex export_mutex_;
    std::atomic<size_t> dropped_{0};
    std::thread worker_;
};

} // namespace logfirecpp::telemetry
