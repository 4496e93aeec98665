#pragma once
#include "logfirecpp/telemetry/id_generator.hpp"
#include "logfirecpp/telemetry/processor.hpp"
#include "logfirecpp/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

/// Deterministic collaborators for tests.
namespace logfirecpp::testing
{

/// Trace ids and span ids each count up from 1, independently.
class IncrementalIdGenerator : public telemetry::IdGenerator
{
  public:
    telemetry::TraceId generate_trace_id() override
    {
        return telemetry::TraceId{0, ++trace_counter_};
    }
    telemetry::SpanId generate_span_id() override
    {
        return ++span_counter_;
    }
    void reset()
    {
        trace_counter_ = 0;
        span_counter_ = 0;
    }

  private:
    std::atomic<uint64_t> trace_counter_{0};
    std::atomic<uint64_t> span_counter_{0};
};

constexpr int64_t ONE_SECOND_IN_NANOSECONDS = 1000000000;

/// Each call returns one second more than the previous, starting at one second.
/// Copies share the same clock, so it can be handed over as a TimestampSource.
class TimeGenerator
{
  public:
    int64_t operator()()
    {
        return *ns_time_ += ONE_SECOND_IN_NANOSECONDS;
    }

  private:
    std::shared_ptr<std::atomic<int64_t>> ns_time_ = std::make_shared<std::atomic<int64_t>>(0);
};

/// In-memory exporter with a compact JSON view using integer ids.
class TestExporter : public telemetry::InMemorySpanExporter
{
  public:
    /// One object per record in export order: name, context, parent,
    /// start_time, end_time, attributes and, when present, events.
    OrderedJson exported_spans_as_json() const;
};

} // namespace logfirecpp::testing
