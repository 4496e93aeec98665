#include "logfirecpp/export/otlp_json.hpp"

#include "logfirecpp/constants.hpp"

namespace logfirecpp::exporting
{
namespace
{

// OTLP span kind: internal.
constexpr int SPAN_KIND_INTERNAL = 1;
// OTLP aggregation temporality: cumulative.
constexpr int TEMPORALITY_CUMULATIVE = 2;

OrderedJson key_value(const std::string& key, OrderedJson value)
{
    OrderedJson kv = OrderedJson::object();
    kv["key"] = key;
    kv["value"] = std::move(value);
    return kv;
}

OrderedJson resource(const std::string& service_name)
{
    OrderedJson attrs = OrderedJson::array();
    attrs.push_back(key_value("service.name", encode_any_value(service_name)));
    attrs.push_back(key_value("telemetry.sdk.name", encode_any_value(std::string("logfirecpp"))));
    attrs.push_back(key_value("telemetry.sdk.language", encode_any_value(std::string("cpp"))));
    attrs.push_back(key_value("telemetry.sdk.version", encode_any_value(std::string(VERSION))));
    return OrderedJson{{"attributes", std::move(attrs)}};
}

OrderedJson scope()
{
    return OrderedJson{{"name", INSTRUMENTATION_NAME}, {"version", VERSION}};
}

int status_code(telemetry::StatusCode code)
{
    switch (code)
    {
    case telemetry::StatusCode::Ok:
        return 1;
    case telemetry::StatusCode::Error:
        return 2;
    default:
        return 0;
    }
}

OrderedJson encode_span(const telemetry::SpanRecord& record)
{
    OrderedJson span = OrderedJson::object();
    span["traceId"] = telemetry::to_hex(record.context.trace_id);
    span["spanId"] = telemetry::to_hex(record.context.span_id);
    if (record.parent)
        span["parentSpanId"] = telemetry::to_hex(record.parent->span_id);
    span["name"] = record.name;
    span["kind"] = SPAN_KIND_INTERNAL;
    span["startTimeUnixNano"] = std::to_string(record.start_time);
    span["endTimeUnixNano"] = std::to_string(record.end_time);
    span["attributes"] = encode_attributes(record.attributes);

    OrderedJson events = OrderedJson::array();
    for (const auto& e : record.events)
    {
        OrderedJson event = OrderedJson::object();
        event["timeUnixNano"] = std::to_string(e.timestamp);
        event["name"] = e.name;
        event["attributes"] = encode_attributes(e.attributes);
        events.push_back(std::move(event));
    }
    if (!events.empty())
        span["events"] = std::move(events);

    OrderedJson status = OrderedJson::object();
    status["code"] = status_code(record.status);
    if (!record.status_description.empty())
        status["message"] = record.status_description;
    span["status"] = std::move(status);
    return span;
}

OrderedJson encode_metric(const metrics::MetricPoint& p)
{
    OrderedJson metric = OrderedJson::object();
    metric["name"] = p.name;
    if (!p.description.empty())
        metric["description"] = p.description;
    if (!p.unit.empty())
        metric["unit"] = p.unit;

    OrderedJson point = OrderedJson::object();
    point["startTimeUnixNano"] = std::to_string(p.start_time);
    point["timeUnixNano"] = std::to_string(p.time);
    if (p.kind == metrics::InstrumentKind::Counter)
    {
        point["asInt"] = std::to_string(p.value);
        OrderedJson sum = OrderedJson::object();
        sum["dataPoints"] = OrderedJson::array({std::move(point)});
        sum["aggregationTemporality"] = TEMPORALITY_CUMULATIVE;
        sum["isMonotonic"] = true;
        metric["sum"] = std::move(sum);
    }
    else
    {
        point["count"] = std::to_string(p.count);
        point["sum"] = p.sum;
        point["min"] = p.min;
        point["max"] = p.max;
        OrderedJson histogram = OrderedJson::object();
        histogram["dataPoints"] = OrderedJson::array({std::move(point)});
        histogram["aggregationTemporality"] = TEMPORALITY_CUMULATIVE;
        metric["histogram"] = std::move(histogram);
    }
    return metric;
}

} // namespace

OrderedJson encode_any_value(const encoding::AttributeValue& value)
{
    struct Visitor
    {
        OrderedJson operator()(const std::string& s) const
        {
            return OrderedJson{{"stringValue", s}};
        }
        OrderedJson operator()(int64_t v) const
        {
            return OrderedJson{{"intValue", std::to_string(v)}};
        }
        OrderedJson operator()(double v) const
        {
            return OrderedJson{{"doubleValue", v}};
        }
        OrderedJson operator()(bool v) const
        {
            return OrderedJson{{"boolValue", v}};
        }
        OrderedJson operator()(const std::vector<std::string>& items) const
        {
            OrderedJson values = OrderedJson::array();
            for (const auto& s : items)
                values.push_back(OrderedJson{{"stringValue", s}});
            return OrderedJson{{"arrayValue", OrderedJson{{"values", std::move(values)}}}};
        }
    };
    return std::visit(Visitor{}, value);
}

OrderedJson encode_attributes(const encoding::AttributeMap& attributes)
{
    OrderedJson out = OrderedJson::array();
    for (const auto& [key, value] : attributes)
        out.push_back(key_value(key, encode_any_value(value)));
    return out;
}

OrderedJson encode_spans(const std::vector<telemetry::SpanRecord>& records,
                         const std::string& service_name)
{
    OrderedJson spans = OrderedJson::array();
    for (const auto& r : records)
        spans.push_back(encode_span(r));

    OrderedJson scope_spans = OrderedJson::object();
    scope_spans["scope"] = scope();
    scope_spans["spans"] = std::move(spans);

    OrderedJson resource_spans = OrderedJson::object();
    resource_spans["resource"] = resource(service_name);
    resource_spans["scopeSpans"] = OrderedJson::array({std::move(scope_spans)});

    OrderedJson out = OrderedJson::object();
    out["resourceSpans"] = OrderedJson::array({std::move(resource_spans)});
    return out;
}

OrderedJson encode_metrics(const std::vector<metrics::MetricPoint>& points,
                           const std::string& service_name)
{
    OrderedJson list = OrderedJson::array();
    for (const auto& p : points)
        list.push_back(encode_metric(p));

    OrderedJson scope_metrics = OrderedJson::object();
    scope_metrics["scope"] = scope();
    scope_metrics["metrics"] = std::move(list);

    OrderedJson resource_metrics = OrderedJson::object();
    resource_metrics["resource"] = resource(service_name);
    resource_metrics["scopeMetrics"] = OrderedJson::array({std::move(scope_metrics)});

    OrderedJson out = OrderedJson::object();
    out["resourceMetrics"] = OrderedJson::array({std::move(resource_metrics)});
    return out;
}

} // namespace logfirecpp::exporting
