#pragma once
#include "logfirecpp/telemetry/id_generator.hpp"
#include "logfirecpp/telemetry/processor.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

namespace logfirecpp::telemetry
{

/// Owns id generation, the timestamp source and the processor list for every
/// record produced through it.
class TracerProvider
{
  public:
    TracerProvider();
    TracerProvider(std::shared_ptr<IdGenerator> id_generator, TimestampSource timestamp);

    void add_span_processor(std::shared_ptr<SpanProcessor> processor);
    std::vector<std::shared_ptr<SpanProcessor>> processors() const;

    /// Hands a finished record to every processor, in registration order.
    void emit(const SpanRecord& record) const;

    IdGenerator& id_generator() const
    {
        return *id_generator_;
    }
    int64_t now() const
    {
        return timestamp_();
    }

    bool force_flush(std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});
    void shutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});
    bool is_shut_down() const
    {
        return shut_down_.load();
    }

  private:
    std::shared_ptr<IdGenerator> id_generator_;
    TimestampSource timestamp_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<SpanProcessor>> processors_;
    std::atomic<bool> shut_down_{false};
};

/// Process-wide provider slot. Starts as a provider with no processors.
/// Handles resolve it on every call, so handles created before configure() see the new one.
std::shared_ptr<TracerProvider> global_provider();
void set_global_provider(std::shared_ptr<TracerProvider> provider);

} // namespace logfirecpp::telemetry
