#include "logfirecpp/telemetry/batch_processor.hpp"

#include "logfirecpp/logging.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace logfirecpp::telemetry
{

BatchSpanProcessor::BatchSpanProcessor(std::shared_ptr<SpanExporter> exporter, BatchOptions options)
    : exporter_(std::move(exporter)), options_(options)
{
    if (!exporter_)
        throw std::invalid_argument("BatchSpanProcessor requires an exporter");
    if (options_.max_export_batch_size == 0)
        options_.max_export_batch_size = 1;
    if (options_.max_queue_size < options_.max_export_batch_size)
        options_.max_queue_size = options_.max_export_batch_size;
    worker_ = std::thread([this]() { worker_loop(); });
}

BatchSpanProcessor::~BatchSpanProcessor()
{
    shutdown(std::chrono::milliseconds{0});
}

void BatchSpanProcessor::on_end(const SpanRecord& record)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_exited_)
        {
            if (queue_.size() >= options_.max_queue_size)
            {
                dropped_.fetch_add(1);
                if (!overflow_reported_)
                {
                    overflow_reported_ = true;
                    logging::logger()->warn(
                        "Span queue is full ({} records), dropping records until it drains",
                        options_.max_queue_size);
                }
                return;
            }
            overflow_reported_ = false;
            queue_.push_back(record);
            if (queue_.size() >= options_.max_export_batch_size)
                queue_cv_.notify_one();
            return;
        }
    }

    // The worker is gone; give the record its flush attempt here.
    logging::logger()->debug("Span '{}' ended after shutdown, exporting synchronously",
                             record.name);
    export_batch({record});
}

bool BatchSpanProcessor::force_flush(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (worker_exited_)
        return true;
    uint64_t target = ++flush_requested_;
    queue_cv_.notify_one();
    return flushed_cv_.wait_for(lock, timeout, [&] { return flush_completed_ >= target; });
}

void BatchSpanProcessor::shutdown(std::chrono::milliseconds timeout)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_)
            return;
        shutting_down_ = true;
    }
    if (timeout.count() > 0 && !force_flush(timeout))
        logging::logger()->warn("Timed out flushing spans during shutdown");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable())
        worker_.join();

    std::lock_guard<std::mutex> lock(export_mutex_);
    exporter_->shutdown();
}

void BatchSpanProcessor::worker_loop()
{
    while (true)
    {
        std::vector<SpanRecord> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait_for(lock, options_.schedule_delay,
                               [&]
                               {
                                   return stop_requested_ ||
                                          queue_.size() >= options_.max_export_batch_size ||
                                          flush_requested_ > flush_completed_;
                               });
            if (queue_.empty())
            {
                if (flush_completed_ < flush_requested_)
                {
                    flush_completed_ = flush_requested_;
                    flushed_cv_.notify_all();
                }
                if (stop_requested_)
                {
                    worker_exited_ = true;
                    flushed_cv_.notify_all();
                    return;
                }
                continue;
            }
            size_t n = std::min(queue_.size(), options_.max_export_batch_size);
            batch.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }
        export_batch(batch);
    }
}

void BatchSpanProcessor::export_batch(const std::vector<SpanRecord>& batch)
{
    std::lock_guard<std::mutex> lock(export_mutex_);
    try
    {
        if (exporter_->export_spans(batch) == ExportResult::Failure)
            logging::logger()->warn("Failed to export a batch of {} spans", batch.size());
    }
    catch (const std::exception& e)
    {
        logging::logger()->error("Exception while exporting a batch of {} spans: {}",
                                 batch.size(), e.what());
    }
}

} // namespace logfirecpp::telemetry
