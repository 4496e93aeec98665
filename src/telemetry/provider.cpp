#include "logfirecpp/telemetry/provider.hpp"

#include "logfirecpp/logging.hpp"

#include <spdlog/spdlog.h>

namespace logfirecpp::telemetry
{
namespace
{

std::mutex& global_mutex()
{
    static std::mutex m;
    return m;
}

std::shared_ptr<TracerProvider>& global_ref()
{
    static std::shared_ptr<TracerProvider> provider = std::make_shared<TracerProvider>();
    return provider;
}

} // namespace

TracerProvider::TracerProvider()
    : TracerProvider(std::make_shared<RandomIdGenerator>(), TimestampSource(now_ns))
{
}

TracerProvider::TracerProvider(std::shared_ptr<IdGenerator> id_generator,
                               TimestampSource timestamp)
    : id_generator_(id_generator ? std::move(id_generator)
                                 : std::make_shared<RandomIdGenerator>()),
      timestamp_(timestamp ? std::move(timestamp) : TimestampSource(now_ns))
{
}

void TracerProvider::add_span_processor(std::shared_ptr<SpanProcessor> processor)
{
    if (!processor)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    processors_.push_back(std::move(processor));
}

std::vector<std::shared_ptr<SpanProcessor>> TracerProvider::processors() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return processors_;
}

void TracerProvider::emit(const SpanRecord& record) const
{
    for (const auto& processor : processors())
        processor->on_end(record);
}

bool TracerProvider::force_flush(std::chrono::milliseconds timeout)
{
    bool ok = true;
    for (const auto& processor : processors())
        ok = processor->force_flush(timeout) && ok;
    return ok;
}

void TracerProvider::shutdown(std::chrono::milliseconds timeout)
{
    if (shut_down_.exchange(true))
        return;
    logging::logger()->debug("Shutting down tracer provider");
    for (const auto& processor : processors())
        processor->shutdown(timeout);
}

std::shared_ptr<TracerProvider> global_provider()
{
    std::lock_guard<std::mutex> lock(global_mutex());
    return global_ref();
}

void set_global_provider(std::shared_ptr<TracerProvider> provider)
{
    std::lock_guard<std::mutex> lock(global_mutex());
    global_ref() = provider ? std::move(provider) : std::make_shared<TracerProvider>();
}

} // namespace logfirecpp::telemetry
