#pragma once
#include "logfirecpp/telemetry/span_record.hpp"

#include <cstdint>
#include <functional>

namespace logfirecpp::telemetry
{

class IdGenerator
{
  public:
    virtual ~IdGenerator() = default;
    virtual TraceId generate_trace_id() = 0;
    virtual SpanId generate_span_id() = 0;
};

/// Non-zero random ids from a per-thread 64-bit Mersenne twister.
class RandomIdGenerator : public IdGenerator
{
  public:
    TraceId generate_trace_id() override;
    SpanId generate_span_id() override;
};

/// Nanosecond wall-clock source used for start/end timestamps.
using TimestampSource = std::function<int64_t()>;

int64_t now_ns();

} // namespace logfirecpp::telemetry
