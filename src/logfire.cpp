#include "logfirecpp/logfire.hpp"

#include "logfirecpp/constants.hpp"
#include "logfirecpp/telemetry/context.hpp"

namespace logfirecpp
{
namespace
{

encoding::AttributeMap with_location(const std::optional<SourceLocation>& location,
                                     const encoding::AttributeMap& attributes)
{
    encoding::AttributeMap out;
    if (location)
    {
        out.set(ATTRIBUTES_CODE_FILEPATH_KEY, location->filename);
        out.set(ATTRIBUTES_CODE_LINENO_KEY, static_cast<int64_t>(location->lineno));
        out.set(ATTRIBUTES_CODE_FUNCTION_KEY, location->function);
    }
    out.merge(attributes);
    return out;
}

} // namespace

Logfire Logfire::tags(const std::vector<std::string>& names) const
{
    return Logfire(tags_.concat(names), provider_);
}

telemetry::SpanHandle Logfire::start_span(const std::string& msg_template, const Args& args,
                                          const SpanOptions& options) const
{
    auto encoded = encoding::encode(msg_template, options.span_name, tags_, args);
    return telemetry::SpanHandle::start(provider(), options.span_name.value_or(msg_template),
                                        std::move(encoded.attributes), options.location);
}

telemetry::SpanScope Logfire::span(const std::string& msg_template, const Args& args,
                                   const SpanOptions& options) const
{
    return start_span(msg_template, args, options).activate(true);
}

void Logfire::log(Level level, const std::string& msg_template, const Args& args,
                  const std::optional<SourceLocation>& location) const
{
    emit_log(level, msg_template, args, location, nullptr);
}

void Logfire::exception(const std::string& msg_template, const Args& args,
                        const std::optional<SourceLocation>& location) const
{
    emit_log(Level::Error, msg_template, args, location, std::current_exception());
}

void Logfire::emit_log(Level level, const std::string& msg_template, const Args& args,
                       const std::optional<SourceLocation>& location,
                       const std::exception_ptr& error) const
{
    auto encoded = encoding::encode(msg_template, std::nullopt, tags_, args);
    auto target = provider();
    auto parent = telemetry::current_context().active_span();
    auto& ids = target->id_generator();

    telemetry::SpanRecord record;
    record.name = encoded.message;
    record.context.trace_id = parent ? parent->trace_id : ids.generate_trace_id();
    record.context.span_id = ids.generate_span_id();
    record.parent = parent;
    record.start_time = target->now();
    record.end_time = record.start_time;
    record.kind = telemetry::SpanKind::Log;
    record.attributes = with_location(location, encoded.attributes);
    record.attributes.set(ATTRIBUTES_LOG_LEVEL_KEY, to_string(level));
    record.attributes.set(ATTRIBUTES_SPAN_TYPE_KEY, to_string(telemetry::SpanKind::Log));
    if (error)
    {
        record.events.push_back(telemetry::capture_exception(error, location, record.start_time));
        record.status = telemetry::StatusCode::Error;
    }
    target->emit(record);
}

const Logfire& logfire()
{
    static const Logfire instance;
    return instance;
}

} // namespace logfirecpp
