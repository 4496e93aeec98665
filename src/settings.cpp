#include "logfirecpp/settings.hpp"

#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace logfirecpp
{

static bool getenv_str(const char* key, std::string& out)
{
    if (const char* v = std::getenv(key))
    {
        out = v;
        return true;
    }
    return false;
}

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool parse_bool(const char* key, const std::string& value)
{
    auto v = lower(value);
    if (v == "1" || v == "true" || v == "yes")
        return true;
    if (v == "0" || v == "false" || v == "no")
        return false;
    throw ConfigurationError(std::string(key) + " must be a boolean, got '" + value + "'");
}

static int64_t parse_int(const char* key, const std::string& value)
{
    const auto message = std::string(key) + " must be an integer, got '" + value + "'";
    size_t consumed = 0;
    int64_t n = 0;
    try
    {
        n = std::stoll(value, &consumed);
    }
    catch (const std::exception&)
    {
        throw ConfigurationError(message);
    }
    if (consumed != value.size())
        throw ConfigurationError(message);
    return n;
}

LogfireConfig LogfireConfig::from_env()
{
    LogfireConfig c;
    std::string v;
    if (getenv_str("LOGFIRE_BASE_URL", v))
        c.base_url = v;
    if (getenv_str("LOGFIRE_SEND_TO_LOGFIRE", v))
        c.send_to_logfire = parse_bool("LOGFIRE_SEND_TO_LOGFIRE", v);
    if (getenv_str("LOGFIRE_TOKEN", v))
        c.token = v;
    if (getenv_str("LOGFIRE_SERVICE_NAME", v))
        c.service_name = v;
    if (getenv_str("LOGFIRE_EXPORTER_FALLBACK_FILE_PATH", v))
        c.exporter_fallback_file_path = v;
    if (getenv_str("OTEL_BSP_SCHEDULE_DELAY", v))
        c.schedule_delay_ms = parse_int("OTEL_BSP_SCHEDULE_DELAY", v);
    if (getenv_str("OTEL_BSP_MAX_QUEUE_SIZE", v))
        c.max_queue_size = parse_int("OTEL_BSP_MAX_QUEUE_SIZE", v);
    if (getenv_str("OTEL_BSP_MAX_EXPORT_BATCH_SIZE", v))
        c.max_export_batch_size = parse_int("OTEL_BSP_MAX_EXPORT_BATCH_SIZE", v);
    if (getenv_str("OTEL_TRACES_EXPORTER", v))
        c.traces_exporter = lower(v);
    if (getenv_str("OTEL_METRIC_EXPORT_INTERVAL", v))
        c.metric_export_interval_ms = parse_int("OTEL_METRIC_EXPORT_INTERVAL", v);
    if (getenv_str("LOGFIRE_LOG_LEVEL", v))
        c.log_level = upper(v);
    return c;
}

LogfireConfig LogfireConfig::from_json(const Json& j)
{
    LogfireConfig c;
    try
    {
        if (j.contains("base_url"))
            c.base_url = j.at("base_url").get<std::string>();
        if (j.contains("send_to_logfire"))
            c.send_to_logfire = j.at("send_to_logfire").get<bool>();
        if (j.contains("token"))
            c.token = j.at("token").get<std::string>();
        if (j.contains("service_name"))
            c.service_name = j.at("service_name").get<std::string>();
        if (j.contains("exporter_fallback_file_path"))
            c.exporter_fallback_file_path = j.at("exporter_fallback_file_path").get<std::string>();
        if (j.contains("schedule_delay_ms"))
            c.schedule_delay_ms = j.at("schedule_delay_ms").get<int64_t>();
        if (j.contains("max_queue_size"))
            c.max_queue_size = j.at("max_queue_size").get<int64_t>();
        if (j.contains("max_export_batch_size"))
            c.max_export_batch_size = j.at("max_export_batch_size").get<int64_t>();
        if (j.contains("max_body_size"))
            c.max_body_size = j.at("max_body_size").get<int64_t>();
        if (j.contains("export_timeout_ms"))
            c.export_timeout_ms = j.at("export_timeout_ms").get<int64_t>();
        if (j.contains("metric_export_interval_ms"))
            c.metric_export_interval_ms = j.at("metric_export_interval_ms").get<int64_t>();
        if (j.contains("traces_exporter"))
            c.traces_exporter = lower(j.at("traces_exporter").get<std::string>());
        if (j.contains("log_level"))
            c.log_level = j.at("log_level").get<std::string>();
        if (j.contains("request_headers"))
            for (const auto& [name, value] : j.at("request_headers").items())
                c.request_headers.emplace_back(name, value.get<std::string>());
    }
    catch (const Json::exception& e)
    {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }
    return c;
}

void LogfireConfig::validate() const
{
    if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0)
        throw ConfigurationError("base_url must start with http:// or https://, got '" +
                                 base_url + "'");
    if (send_to_logfire && traces_exporter != "none" && token.empty())
        throw ConfigurationError(
            "send_to_logfire is enabled but no token was provided (set LOGFIRE_TOKEN)");
    if (schedule_delay_ms <= 0)
        throw ConfigurationError("schedule_delay_ms must be positive");
    if (max_queue_size <= 0)
        throw ConfigurationError("max_queue_size must be positive");
    if (max_export_batch_size <= 0)
        throw ConfigurationError("max_export_batch_size must be positive");
    if (max_export_batch_size > max_queue_size)
        throw ConfigurationError("max_export_batch_size (" +
                                 std::to_string(max_export_batch_size) +
                                 ") must not exceed max_queue_size (" +
                                 std::to_string(max_queue_size) + ")");
    if (max_body_size <= 0)
        throw ConfigurationError("max_body_size must be positive");
    if (export_timeout_ms <= 0)
        throw ConfigurationError("export_timeout_ms must be positive");
    if (metric_export_interval_ms <= 0)
        throw ConfigurationError("metric_export_interval_ms must be positive");
    if (traces_exporter != "otlp" && traces_exporter != "none")
        throw ConfigurationError("Unsupported traces_exporter '" + traces_exporter +
                                 "' (expected 'otlp' or 'none')");
    if (!logging::is_known_level(log_level))
        throw ConfigurationError("Unknown log_level '" + log_level + "'");
}

} // namespace logfirecpp
