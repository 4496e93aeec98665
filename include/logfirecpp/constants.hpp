#pragma once

namespace logfirecpp
{

// Reserved attribute keys. User arguments may not use these names.
constexpr const char* ATTRIBUTES_CODE_FILEPATH_KEY = "code.filepath";
constexpr const char* ATTRIBUTES_CODE_LINENO_KEY = "code.lineno";
constexpr const char* ATTRIBUTES_CODE_FUNCTION_KEY = "code.function";

constexpr const char* ATTRIBUTES_NAMESPACE = "logfire.";
constexpr const char* ATTRIBUTES_MESSAGE_TEMPLATE_KEY = "logfire.msg_template";
constexpr const char* ATTRIBUTES_MESSAGE_KEY = "logfire.msg";
constexpr const char* ATTRIBUTES_SPAN_TYPE_KEY = "logfire.span_type";
constexpr const char* ATTRIBUTES_TAGS_KEY = "logfire.tags";
constexpr const char* ATTRIBUTES_LOG_LEVEL_KEY = "logfire.level";
constexpr const char* ATTRIBUTES_START_PARENT_ID_KEY = "logfire.start_parent_id";
constexpr const char* NULL_ARGS_KEY = "logfire.null_args";

constexpr const char* JSON_SUFFIX = "__JSON";
constexpr const char* DATATYPE_KEY = "$__datatype__";

constexpr const char* START_SPAN_NAME_SUFFIX = " (start)";
constexpr const char* ROOT_START_PARENT_ID = "0";

constexpr const char* EXCEPTION_EVENT_NAME = "exception";
constexpr const char* EXCEPTION_TYPE_KEY = "exception.type";
constexpr const char* EXCEPTION_MESSAGE_KEY = "exception.message";
constexpr const char* EXCEPTION_STACKTRACE_KEY = "exception.stacktrace";
constexpr const char* EXCEPTION_ESCAPED_KEY = "exception.escaped";
constexpr const char* EXCEPTION_DATA_KEY = "exception.logfire.data";
constexpr const char* EXCEPTION_TRACE_KEY = "exception.logfire.trace";

constexpr const char* INSTRUMENTATION_NAME = "logfire";
constexpr const char* TRACES_PATH = "/v1/traces";
constexpr const char* METRICS_PATH = "/v1/metrics";

} // namespace logfirecpp
