#include "logfirecpp/metrics/periodic_reader.hpp"

#include "logfirecpp/logging.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace logfirecpp::metrics
{

PeriodicMetricReader::PeriodicMetricReader(std::shared_ptr<MeterProvider> provider,
                                           std::shared_ptr<MetricExporter> exporter,
                                           std::chrono::milliseconds interval)
    : provider_(std::move(provider)), exporter_(std::move(exporter)), interval_(interval)
{
    if (!provider_ || !exporter_)
        throw std::invalid_argument("PeriodicMetricReader requires a provider and an exporter");
    if (interval_.count() <= 0)
        interval_ = std::chrono::milliseconds{60000};
    worker_ = std::thread([this]() { worker_loop(); });
}

PeriodicMetricReader::~PeriodicMetricReader()
{
    shutdown();
}

bool PeriodicMetricReader::force_flush()
{
    return collect_and_export();
}

void PeriodicMetricReader::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_)
            return;
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();

    collect_and_export();
    std::lock_guard<std::mutex> lock(export_mutex_);
    exporter_->shutdown();
}

uint64_t PeriodicMetricReader::collection_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return collections_;
}

void PeriodicMetricReader::worker_loop()
{
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [&] { return stop_requested_; }))
                return;
        }
        collect_and_export();
    }
}

bool PeriodicMetricReader::collect_and_export()
{
    std::lock_guard<std::mutex> lock(export_mutex_);
    {
        std::lock_guard<std::mutex> count_lock(mutex_);
        ++collections_;
    }
    auto points = provider_->collect();
    if (points.empty())
        return true;
    try
    {
        if (exporter_->export_metrics(points) == ExportResult::Success)
            return true;
        logging::logger()->warn("Failed to export {} metric points", points.size());
    }
    catch (const std::exception& e)
    {
        logging::logger()->error("Exception while exporting {} metric points: {}",
                                 points.size(), e.what());
    }
    return false;
}

} // namespace logfirecpp::metrics
