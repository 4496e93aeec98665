#pragma once
#include "logfirecpp/telemetry/span_record.hpp"
#include "logfirecpp/types.hpp"

#include <exception>
#include <optional>
#include <string>
#include <typeinfo>
#include <vector>

namespace logfirecpp::telemetry
{

/// Static source location only. There is no `locals` field; it is always written as null.
struct StackFrame
{
    std::string filename;
    int lineno{0};
    std::string name;
    std::string line;
};

/// One error of a cause chain.
struct ExceptionStack
{
    std::string exc_type;
    std::string exc_value;
    bool is_cause{false};
    std::vector<StackFrame> frames;
};

constexpr std::size_t MAX_CAUSE_CHAIN = 32;

/// Readable name of a dynamic exception type, with the nesting wrapper of
/// std::throw_with_nested removed.
std::string exception_type_name(const std::type_info& type);

/// Walks `error` and its std::nested_exception causes, outer to inner.
/// `scope_location` is the first frame of the outermost stack.
/// Frames already listed by an outer stack are not repeated.
std::vector<ExceptionStack> walk_exception_chain(const std::exception_ptr& error,
                                                 const std::optional<SourceLocation>& scope_location);

OrderedJson to_json(const std::vector<ExceptionStack>& stacks);

/// Human-readable stack text ("Type: message", "  at ...", "Caused by: ...").
std::string format_stacktrace(const std::vector<ExceptionStack>& stacks);

/// Builds the `exception` event for a failing span. Never throws: an internal
/// failure yields an event with an empty trace and a logged warning.
SpanEvent capture_exception(const std::exception_ptr& error,
                            const std::optional<SourceLocation>& scope_location,
                            int64_t timestamp) noexcept;

} // namespace logfirecpp::telemetry
