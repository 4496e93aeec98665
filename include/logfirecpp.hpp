#pragma once

/// @file logfirecpp.hpp
/// @brief Main header for logfirecpp - includes commonly used components
///
/// Usage:
/// @code
/// #include <logfirecpp.hpp>
///
/// int main() {
///     auto config = logfirecpp::LogfireConfig::from_env();
///     logfirecpp::configure(config);
///
///     auto lf = logfirecpp::logfire().tags("worker");
///     {
///         auto span = lf.span("processing {item}", {{"item", "a.csv"}});
///         lf.info("read {rows} rows", {{"rows", 42}});
///     }
///     logfirecpp::shutdown();
/// }
/// @endcode

// Core types and exceptions
#include "logfirecpp/types.hpp"
#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/constants.hpp"
#include "logfirecpp/settings.hpp"

// Emission
#include "logfirecpp/logfire.hpp"
#include "logfirecpp/telemetry/context.hpp"
#include "logfirecpp/telemetry/span.hpp"

// Processors and exporters
#include "logfirecpp/telemetry/batch_processor.hpp"
#include "logfirecpp/export/fallback_exporter.hpp"
#include "logfirecpp/export/file_exporter.hpp"
#include "logfirecpp/export/otlp_exporter.hpp"

// Metrics
#include "logfirecpp/metrics/meter.hpp"
#include "logfirecpp/metrics/periodic_reader.hpp"

// Process-wide configuration
#include "logfirecpp/config.hpp"
