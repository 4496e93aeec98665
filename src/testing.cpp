#include "logfirecpp/testing.hpp"

namespace logfirecpp::testing
{
namespace
{

OrderedJson context_json(const telemetry::SpanContext& ctx)
{
    OrderedJson j = OrderedJson::object();
    j["trace_id"] = ctx.trace_id.low;
    j["span_id"] = ctx.span_id;
    j["is_remote"] = false;
    return j;
}

} // namespace

OrderedJson TestExporter::exported_spans_as_json() const
{
    OrderedJson out = OrderedJson::array();
    for (const auto& record : finished_spans())
    {
        // Same layout as telemetry::to_json, with integer ids.
        OrderedJson j = telemetry::to_json(record);
        j["context"] = context_json(record.context);
        j["parent"] = record.parent ? context_json(*record.parent) : OrderedJson(nullptr);
        out.push_back(std::move(j));
    }
    return out;
}

} // namespace logfirecpp::testing
