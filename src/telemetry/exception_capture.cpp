#include "logfirecpp/telemetry/exception_capture.hpp"

#include "logfirecpp/constants.hpp"
#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/logging.hpp"

#include <cstdlib>
#include <memory>
#include <set>
#include <spdlog/spdlog.h>
#include <tuple>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace logfirecpp::telemetry
{
namespace
{

using FrameKey = std::tuple<std::string, int, std::string>;

std::string demangle(const char* name)
{
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(abi::__cxa_demangle(name, nullptr, nullptr, &status),
                                               std::free);
    if (status == 0 && out)
        return out.get();
#endif
    return name;
}

std::string strip_wrapper(const std::string& name, const std::string& prefix)
{
    if (name.size() > prefix.size() + 1 && name.compare(0, prefix.size(), prefix) == 0 &&
        name.back() == '>')
        return name.substr(prefix.size(), name.size() - prefix.size() - 1);
    return name;
}

StackFrame frame_from(const SourceLocation& loc)
{
    return StackFrame{loc.filename, loc.lineno, loc.function, ""};
}

struct Inspected
{
    ExceptionStack stack;
    std::exception_ptr cause;
};

// Rethrows `error` locally to read its dynamic type, message, location and nested cause.
Inspected inspect(const std::exception_ptr& error, bool is_cause)
{
    Inspected out;
    out.stack.is_cause = is_cause;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        out.stack.exc_type = exception_type_name(typeid(e));
        out.stack.exc_value = e.what();
        if (auto* err = dynamic_cast<const Error*>(&e); err && err->where())
            out.stack.frames.push_back(frame_from(*err->where()));
        if (auto* nested = dynamic_cast<const std::nested_exception*>(&e))
            out.cause = nested->nested_ptr();
    }
    catch (...)
    {
        // Not a std::exception; the caller still owns and rethrows it.
        out.stack.exc_type = "unknown";
    }
    return out;
}

void dedupe(ExceptionStack& stack, std::set<FrameKey>& seen)
{
    std::vector<StackFrame> kept;
    for (auto& frame : stack.frames)
    {
        if (seen.insert(FrameKey{frame.filename, frame.lineno, frame.name}).second)
            kept.push_back(std::move(frame));
    }
    stack.frames = std::move(kept);
}

OrderedJson validation_json(const ValidationError& error)
{
    OrderedJson out = OrderedJson::array();
    for (const auto& field : error.errors())
    {
        OrderedJson item = OrderedJson::object();
        item["type"] = field.type;
        item["loc"] = OrderedJson::parse(field.loc.dump());
        item["msg"] = field.msg;
        item["input"] = OrderedJson::parse(field.input.dump());
        out.push_back(std::move(item));
    }
    return out;
}

std::optional<OrderedJson> validation_data(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const ValidationError& v)
    {
        return validation_json(v);
    }
    catch (...)
    {
        return std::nullopt;
    }
}

} // namespace

std::string exception_type_name(const std::type_info& type)
{
    auto name = demangle(type.name());
    name = strip_wrapper(name, "std::_Nested_exception<");
    name = strip_wrapper(name, "std::__1::__nested<");
    name = strip_wrapper(name, "std::__nested<");
    return name;
}

std::vector<ExceptionStack> walk_exception_chain(const std::exception_ptr& error,
                                                 const std::optional<SourceLocation>& scope_location)
{
    std::vector<ExceptionStack> stacks;
    std::set<FrameKey> seen;
    std::exception_ptr current = error;
    while (current && stacks.size() < MAX_CAUSE_CHAIN)
    {
        auto inspected = inspect(current, !stacks.empty());
        if (stacks.empty() && scope_location)
            inspected.stack.frames.insert(inspected.stack.frames.begin(),
                                          frame_from(*scope_location));
        dedupe(inspected.stack, seen);
        stacks.push_back(std::move(inspected.stack));
        current = inspected.cause;
    }
    return stacks;
}

OrderedJson to_json(const std::vector<ExceptionStack>& stacks)
{
    OrderedJson list = OrderedJson::array();
    for (const auto& stack : stacks)
    {
        OrderedJson frames = OrderedJson::array();
        for (const auto& f : stack.frames)
        {
            OrderedJson frame = OrderedJson::object();
            frame["filename"] = f.filename;
            frame["lineno"] = f.lineno;
            frame["name"] = f.name;
            frame["line"] = f.line;
            frame["locals"] = nullptr;
            frames.push_back(std::move(frame));
        }
        OrderedJson s = OrderedJson::object();
        s["exc_type"] = stack.exc_type;
        s["exc_value"] = stack.exc_value;
        s["syntax_error"] = nullptr;
        s["is_cause"] = stack.is_cause;
        s["frames"] = std::move(frames);
        list.push_back(std::move(s));
    }
    OrderedJson out = OrderedJson::object();
    out["stacks"] = std::move(list);
    return out;
}

std::string format_stacktrace(const std::vector<ExceptionStack>& stacks)
{
    std::string out;
    for (const auto& stack : stacks)
    {
        if (stack.is_cause)
            out += "Caused by: ";
        out += stack.exc_type;
        if (!stack.exc_value.empty())
            out += ": " + stack.exc_value;
        out += "\n";
        for (const auto& f : stack.frames)
            out += "  at " + f.name + " (" + f.filename + ":" + std::to_string(f.lineno) + ")\n";
    }
    return out;
}

SpanEvent capture_exception(const std::exception_ptr& error,
                            const std::optional<SourceLocation>& scope_location,
                            int64_t timestamp) noexcept
{
    SpanEvent event;
    event.name = EXCEPTION_EVENT_NAME;
    event.timestamp = timestamp;
    try
    {
        if (!error)
            throw CaptureError("no exception to capture");

        auto stacks = walk_exception_chain(error, scope_location);
        const auto& outer = stacks.front();
        event.attributes.set(EXCEPTION_TYPE_KEY, outer.exc_type);
        event.attributes.set(EXCEPTION_MESSAGE_KEY, outer.exc_value);
        event.attributes.set(EXCEPTION_STACKTRACE_KEY, format_stacktrace(stacks));
        event.attributes.set(EXCEPTION_ESCAPED_KEY, true);

        if (auto data = validation_data(error))
            event.attributes.set(EXCEPTION_DATA_KEY, data->dump());

        event.attributes.set(EXCEPTION_TRACE_KEY, to_json(stacks).dump());
    }
    catch (const std::exception& e)
    {
        logging::logger()->warn("Failed to capture exception details: {}", e.what());
        event.attributes = encoding::AttributeMap();
        event.attributes.set(EXCEPTION_TYPE_KEY, std::string("unknown"));
        event.attributes.set(EXCEPTION_MESSAGE_KEY, std::string());
        event.attributes.set(EXCEPTION_TRACE_KEY, std::string(R"({"stacks":[]})"));
    }
    return event;
}

} // namespace logfirecpp::telemetry
