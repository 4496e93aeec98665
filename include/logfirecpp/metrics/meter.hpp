#pragma once
#include "logfirecpp/telemetry/id_generator.hpp"
#include "logfirecpp/telemetry/processor.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace logfirecpp::metrics
{

using telemetry::ExportResult;

enum class InstrumentKind
{
    Counter,
    Histogram
};

/// One aggregated, cumulative data point per instrument.
struct MetricPoint
{
    std::string name;
    std::string description;
    std::string unit;
    InstrumentKind kind{InstrumentKind::Counter};
    int64_t start_time{0};
    int64_t time{0};

    int64_t value{0}; ///< counter sum

    uint64_t count{0}; ///< histogram fields
    double sum{0.0};
    double min{0.0};
    double max{0.0};
};

class MetricExporter
{
  public:
    virtual ~MetricExporter() = default;
    virtual ExportResult export_metrics(const std::vector<MetricPoint>& points) = 0;
    virtual void shutdown() {}
};

class InMemoryMetricExporter : public MetricExporter
{
  public:
    ExportResult export_metrics(const std::vector<MetricPoint>& points) override;
    /// Every batch exported so far, in order.
    std::vector<std::vector<MetricPoint>> exported() const;
    void reset();

  private:
    mutable std::mutex mutex_;
    std::vector<std::vector<MetricPoint>> batches_;
};

namespace detail
{
struct InstrumentState
{
    std::string name;
    std::string description;
    std::string unit;
    InstrumentKind kind;
    int64_t start_time{0};

    std::mutex mutex;
    int64_t value{0};
    uint64_t count{0};
    double sum{0.0};
    double min{0.0};
    double max{0.0};
};
} // namespace detail

/// Monotonic int64 sum.
class Counter
{
  public:
    Counter() = default;
    explicit Counter(std::shared_ptr<detail::InstrumentState> state) : state_(std::move(state)) {}

    /// Negative increments are rejected with a logged warning.
    void add(int64_t amount);

  private:
    std::shared_ptr<detail::InstrumentState> state_;
};

/// Count, sum, min and max of recorded values.
class Histogram
{
  public:
    Histogram() = default;
    explicit Histogram(std::shared_ptr<detail::InstrumentState> state) : state_(std::move(state)) {}

    void record(double value);

  private:
    std::shared_ptr<detail::InstrumentState> state_;
};

/// Creates instruments and snapshots their aggregates. Asking for an existing
/// name returns the same instrument.
class MeterProvider
{
  public:
    explicit MeterProvider(telemetry::TimestampSource timestamp = telemetry::now_ns);

    /// Throws ConfigurationError when `name` is already used by a histogram.
    Counter create_counter(const std::string& name, const std::string& description = {},
                           const std::string& unit = {});
    /// Throws ConfigurationError when `name` is already used by a counter.
    Histogram create_histogram(const std::string& name, const std::string& description = {},
                               const std::string& unit = {});

    /// Cumulative points for every instrument that has recorded something.
    std::vector<MetricPoint> collect() const;

  private:
    std::shared_ptr<detail::InstrumentState> instrument(const std::string& name,
                                                        const std::string& description,
                                                        const std::string& unit,
                                                        InstrumentKind kind);

    telemetry::TimestampSource timestamp_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<detail::InstrumentState>> instruments_;
};

std::shared_ptr<MeterProvider> global_meter_provider();
void set_global_meter_provider(std::shared_ptr<MeterProvider> provider);

} // namespace logfirecpp::metrics
