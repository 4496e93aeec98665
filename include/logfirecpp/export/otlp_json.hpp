#pragma once
#include "logfirecpp/encoding/attributes.hpp"
#include "logfirecpp/metrics/meter.hpp"
#include "logfirecpp/telemetry/span_record.hpp"
#include "logfirecpp/types.hpp"

#include <string>
#include <vector>

namespace logfirecpp::exporting
{

/// OTLP/HTTP JSON encoding. 64-bit integers are written as decimal strings,
/// ids as lowercase hex.
OrderedJson encode_any_value(const encoding::AttributeValue& value);
OrderedJson encode_attributes(const encoding::AttributeMap& attributes);

/// `{"resourceSpans": [...]}` with one resource (service.name) and one "logfire" scope.
OrderedJson encode_spans(const std::vector<telemetry::SpanRecord>& records,
                         const std::string& service_name);

/// `{"resourceMetrics": [...]}` with cumulative temporality.
OrderedJson encode_metrics(const std::vector<metrics::MetricPoint>& points,
                           const std::string& service_name);

} // namespace logfirecpp::exporting
