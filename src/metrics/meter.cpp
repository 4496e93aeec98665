#include "logfirecpp/metrics/meter.hpp"

#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/logging.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace logfirecpp::metrics
{
namespace
{

std::mutex& global_mutex()
{
    static std::mutex m;
    return m;
}

std::shared_ptr<MeterProvider>& global_ref()
{
    static std::shared_ptr<MeterProvider> provider = std::make_shared<MeterProvider>();
    return provider;
}

} // namespace

ExportResult InMemoryMetricExporter::export_metrics(const std::vector<MetricPoint>& points)
{
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.push_back(points);
    return ExportResult::Success;
}

std::vector<std::vector<MetricPoint>> InMemoryMetricExporter::exported() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
}

void InMemoryMetricExporter::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.clear();
}

void Counter::add(int64_t amount)
{
    if (!state_)
        return;
    if (amount < 0)
    {
        logging::logger()->warn("Counter '{}' ignored negative increment {}", state_->name,
                                amount);
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->value += amount;
    ++state_->count;
}

void Histogram::record(double value)
{
    if (!state_)
        return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->count == 0)
    {
        state_->min = value;
        state_->max = value;
    }
    else
    {
        state_->min = std::min(state_->min, value);
        state_->max = std::max(state_->max, value);
    }
    ++state_->count;
    state_->sum += value;
}

MeterProvider::MeterProvider(telemetry::TimestampSource timestamp)
    : timestamp_(timestamp ? std::move(timestamp) : telemetry::TimestampSource(telemetry::now_ns))
{
}

std::shared_ptr<detail::InstrumentState>
MeterProvider::instrument(const std::string& name, const std::string& description,
                          const std::string& unit, InstrumentKind kind)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instruments_.find(name);
    if (it != instruments_.end())
    {
        if (it->second->kind != kind)
            throw ConfigurationError("Metric '" + name +
                                     "' is already registered as a different instrument kind");
        return it->second;
    }
    auto state = std::make_shared<detail::InstrumentState>();
    state->name = name;
    state->description = description;
    state->unit = unit;
    state->kind = kind;
    state->start_time = timestamp_();
    instruments_.emplace(name, state);
    return state;
}

Counter MeterProvider::create_counter(const std::string& name, const std::string& description,
                                      const std::string& unit)
{
    return Counter(instrument(name, description, unit, InstrumentKind::Counter));
}

Histogram MeterProvider::create_histogram(const std::string& name,
                                          const std::string& description,
                                          const std::string& unit)
{
    return Histogram(instrument(name, description, unit, InstrumentKind::Histogram));
}

std::vector<MetricPoint> MeterProvider::collect() const
{
    std::vector<std::shared_ptr<detail::InstrumentState>> states;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, state] : instruments_)
            states.push_back(state);
    }

    std::vector<MetricPoint> points;
    const int64_t now = timestamp_();
    for (const auto& state : states)
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->count == 0)
            continue;
        MetricPoint p;
        p.name = state->name;
        p.description = state->description;
        p.unit = state->unit;
        p.kind = state->kind;
        p.start_time = state->start_time;
        p.time = now;
        p.value = state->value;
        p.count = state->count;
        p.sum = state->sum;
        p.min = state->min;
        p.max = state->max;
        points.push_back(std::move(p));
    }
    return points;
}

std::shared_ptr<MeterProvider> global_meter_provider()
{
    std::lock_guard<std::mutex> lock(global_mutex());
    return global_ref();
}

void set_global_meter_provider(std::shared_ptr<MeterProvider> provider)
{
    std::lock_guard<std::mutex> lock(global_mutex());
    global_ref() = provider ? std::move(provider) : std::make_shared<MeterProvider>();
}

} // namespace logfirecpp::metrics
