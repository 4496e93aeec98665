#include "logfirecpp/telemetry/id_generator.hpp"

#include <chrono>
#include <random>

namespace logfirecpp::telemetry
{
namespace
{

std::mt19937_64& rng()
{
    thread_local std::mt19937_64 gen(
        (static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}());
    return gen;
}

uint64_t random_nonzero()
{
    uint64_t v = 0;
    while (v == 0)
        v = rng()();
    return v;
}

} // namespace

TraceId RandomIdGenerator::generate_trace_id()
{
    return TraceId{rng()(), random_nonzero()};
}

SpanId RandomIdGenerator::generate_span_id()
{
    return random_nonzero();
}

int64_t now_ns()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace logfirecpp::telemetry
