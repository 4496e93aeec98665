#pragma once
#include "logfirecpp/encoding/attributes.hpp"
#include "logfirecpp/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace logfirecpp::telemetry
{

using SpanId = uint64_t;

struct TraceId
{
    uint64_t high{0};
    uint64_t low{0};

    bool is_valid() const
    {
        return high != 0 || low != 0;
    }
    bool operator==(const TraceId& other) const
    {
        return high == other.high && low == other.low;
    }
    bool operator!=(const TraceId& other) const
    {
        return !(*this == other);
    }
};

struct SpanContext
{
    TraceId trace_id;
    SpanId span_id{0};

    bool is_valid() const
    {
        return trace_id.is_valid() && span_id != 0;
    }
    bool operator==(const SpanContext& other) const
    {
        return trace_id == other.trace_id && span_id == other.span_id;
    }
    bool operator!=(const SpanContext& other) const
    {
        return !(*this == other);
    }
};

/// Which of the three record shapes a finished record is.
enum class SpanKind
{
    Span,
    StartSpan,
    Log
};

enum class StatusCode
{
    Unset,
    Ok,
    Error
};

struct SpanEvent
{
    std::string name;
    int64_t timestamp{0};
    encoding::AttributeMap attributes;
};

/// A finished, immutable record as handed to processors.
struct SpanRecord
{
    std::string name;
    SpanContext context;
    std::optional<SpanContext> parent;
    int64_t start_time{0}; ///< ns since epoch
    int64_t end_time{0};   ///< ns since epoch
    encoding::AttributeMap attributes;
    std::vector<SpanEvent> events;
    SpanKind kind{SpanKind::Span};
    StatusCode status{StatusCode::Unset};
    std::string status_description;
};

std::string to_string(SpanKind kind);

std::string to_hex(const TraceId& id);
std::string to_hex(SpanId id);

OrderedJson to_json(const SpanEvent& event);

/// Test-friendly JSON view: name, context, parent, times, attributes and,
/// when present, events.
OrderedJson to_json(const SpanRecord& record);

} // namespace logfirecpp::telemetry
