#include "logfirecpp/logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace logfirecpp::logging
{
namespace
{

std::mutex& logger_mutex()
{
    static std::mutex m;
    return m;
}

bool parse_level(std::string name, spdlog::level::level_enum& out)
{
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "TRACE")
        out = spdlog::level::trace;
    else if (name == "DEBUG")
        out = spdlog::level::debug;
    else if (name == "INFO")
        out = spdlog::level::info;
    else if (name == "WARN" || name == "WARNING")
        out = spdlog::level::warn;
    else if (name == "ERROR")
        out = spdlog::level::err;
    else if (name == "CRITICAL")
        out = spdlog::level::critical;
    else if (name == "OFF")
        out = spdlog::level::off;
    else
        return false;
    return true;
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (auto existing = spdlog::get(LOGGER_NAME))
        return existing;

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v");
    auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    created->set_level(spdlog::level::info);
    spdlog::register_logger(created);
    return created;
}

bool set_level(const std::string& level)
{
    spdlog::level::level_enum parsed;
    if (!parse_level(level, parsed))
        return false;
    logger()->set_level(parsed);
    return true;
}

bool is_known_level(const std::string& level)
{
    spdlog::level::level_enum parsed;
    return parse_level(level, parsed);
}

std::string level_name()
{
    auto name = spdlog::level::to_string_view(logger()->level());
    return std::string(name.data(), name.size());
}

} // namespace logfirecpp::logging
