#pragma once

#include <memory>
#include <string>

namespace spdlog
{
class logger;
}

namespace logfirecpp::logging
{

constexpr const char* LOGGER_NAME = "logfirecpp";

/// SDK diagnostics logger. Created on first use with a stderr colour sink.
std::shared_ptr<spdlog::logger> logger();

/// Accepts TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL or OFF (any case).
/// Unknown names leave the level unchanged and return false.
bool set_level(const std::string& level);

bool is_known_level(const std::string& level);

std::string level_name();

} // namespace logfirecpp::logging
