#include "logfirecpp/telemetry/span_record.hpp"

#include <iomanip>
#include <sstream>

namespace logfirecpp::telemetry
{
namespace
{

std::string hex64(uint64_t v)
{
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << v;
    return oss.str();
}

OrderedJson context_json(const SpanContext& ctx)
{
    OrderedJson j = OrderedJson::object();
    j["trace_id"] = to_hex(ctx.trace_id);
    j["span_id"] = to_hex(ctx.span_id);
    return j;
}

} // namespace

std::string to_string(SpanKind kind)
{
    switch (kind)
    {
    case SpanKind::Span:
        return "span";
    case SpanKind::StartSpan:
        return "start_span";
    case SpanKind::Log:
        return "log";
    }
    return "span";
}

std::string to_hex(const TraceId& id)
{
    return hex64(id.high) + hex64(id.low);
}

std::string to_hex(SpanId id)
{
    return hex64(id);
}

OrderedJson to_json(const SpanEvent& event)
{
    OrderedJson j = OrderedJson::object();
    j["name"] = event.name;
    j["timestamp"] = event.timestamp;
    j["attributes"] = event.attributes.to_json();
    return j;
}

OrderedJson to_json(const SpanRecord& record)
{
    OrderedJson j = OrderedJson::object();
    j["name"] = record.name;
    j["context"] = context_json(record.context);
    j["parent"] = record.parent ? context_json(*record.parent) : OrderedJson(nullptr);
    j["start_time"] = record.start_time;
    j["end_time"] = record.end_time;
    j["attributes"] = record.attributes.to_json();
    if (!record.events.empty())
    {
        OrderedJson events = OrderedJson::array();
        for (const auto& e : record.events)
            events.push_back(to_json(e));
        j["events"] = std::move(events);
    }
    return j;
}

} // namespace logfirecpp::telemetry
