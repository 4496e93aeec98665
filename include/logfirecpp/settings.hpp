#pragma once
#include "logfirecpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace logfirecpp
{

/// Every value that stays fixed for the lifetime of a configuration.
struct LogfireConfig
{
    std::string base_url{"https://api.logfire.dev"};
    bool send_to_logfire{true};
    std::string token;
    std::string service_name{"unknown_service"};
    /// Durable store for batches the network rejected. Empty disables it.
    std::string exporter_fallback_file_path{"logfire_spans.bin"};

    int64_t schedule_delay_ms{500};
    int64_t max_queue_size{2048};
    int64_t max_export_batch_size{512};
    int64_t max_body_size{5 * 1024 * 1024};
    int64_t export_timeout_ms{10000};
    int64_t metric_export_interval_ms{60000};

    /// "otlp" or "none".
    std::string traces_exporter{"otlp"};
    std::string log_level{"INFO"};
    std::vector<std::pair<std::string, std::string>> request_headers;

    /// Starts from the defaults and applies the LOGFIRE_* / OTEL_* variables that are set.
    /// Throws ConfigurationError for malformed numbers or booleans.
    static LogfireConfig from_env();
    /// Same keys in snake_case. Unknown keys are ignored.
    static LogfireConfig from_json(const Json& j);

    /// Throws ConfigurationError describing the first problem found.
    void validate() const;
};

} // namespace logfirecpp
