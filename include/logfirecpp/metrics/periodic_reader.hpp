#pragma once
#include "logfirecpp/metrics/meter.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace logfirecpp::metrics
{

/// Collects the provider's aggregates on its own thread every `interval` and
/// hands them to the exporter. Independent of span batching.
class PeriodicMetricReader
{
  public:
    PeriodicMetricReader(std::shared_ptr<MeterProvider> provider,
                         std::shared_ptr<MetricExporter> exporter,
                         std::chrono::milliseconds interval = std::chrono::milliseconds{60000});
    ~PeriodicMetricReader();
    PeriodicMetricReader(const PeriodicMetricReader&) = delete;
    PeriodicMetricReader& operator=(const PeriodicMetricReader&) = delete;

    /// Collects and exports now, on the calling thread.
    bool force_flush();
    /// Stops the worker after one final collection.
    void shutdown();

    uint64_t collection_count() const;

  private:
    void worker_loop();
    bool collect_and_export();

    std::shared_ptr<MeterProvider> provider_;
    std::shared_ptr<MetricExporter> exporter_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    uint64_t collections_{0};

    std::mutex export_mutex_;
    std::thread worker_;
};

} // namespace logfirecpp::metrics
