/// @brief OTLP exporters against a local cpp-httplib server

#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/export/otlp_exporter.hpp"
#include "logfirecpp/export/otlp_json.hpp"

#include <cassert>
#include <chrono>
#include <httplib.h>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace logfirecpp;
using namespace logfirecpp::exporting;

namespace
{

struct Received
{
    std::string path;
    std::string authorization;
    std::string user_agent;
    std::string extra;
    std::string body;
};

telemetry::SpanRecord sample_span()
{
    telemetry::SpanRecord r;
    r.name = "hello";
    r.context = telemetry::SpanContext{telemetry::TraceId{0, 0xabc}, 0x12};
    r.parent = telemetry::SpanContext{telemetry::TraceId{0, 0xabc}, 0x11};
    r.start_time = 1000000000;
    r.end_time = 2000000000;
    r.attributes.set("s", std::string("text"));
    r.attributes.set("i", int64_t{7});
    r.attributes.set("d", 1.5);
    r.attributes.set("b", true);
    r.attributes.set("logfire.tags", std::vector<std::string>{"a", "b"});
    r.status = telemetry::StatusCode::Error;
    r.status_description = "boom";
    telemetry::SpanEvent e;
    e.name = "exception";
    e.timestamp = 1500000000;
    e.attributes.set("exception.type", std::string("std::runtime_error"));
    r.events.push_back(e);
    return r;
}

} // namespace

int main()
{
    std::cout << "=== OTLP Exporter Tests ===" << std::endl;

    std::cout << "test_span_encoding..." << std::endl;
    {
        auto j = encode_spans({sample_span()}, "svc");
        const auto& rs = j["resourceSpans"][0];
        assert(rs["resource"]["attributes"][0]["key"] == "service.name");
        assert(rs["resource"]["attributes"][0]["value"]["stringValue"] == "svc");
        assert(rs["scopeSpans"][0]["scope"]["name"] == "logfire");
        const auto& span = rs["scopeSpans"][0]["spans"][0];
        assert(span["traceId"] == "00000000000000000000000000000abc");
        assert(span["spanId"] == "0000000000000012");
        assert(span["parentSpanId"] == "0000000000000011");
        assert(span["startTimeUnixNano"] == "1000000000");
        assert(span["endTimeUnixNano"] == "2000000000");
        const auto& attrs = span["attributes"];
        assert(attrs[0]["value"]["stringValue"] == "text");
        assert(attrs[1]["value"]["intValue"] == "7");
        assert(attrs[2]["value"]["doubleValue"] == 1.5);
        assert(attrs[3]["value"]["boolValue"] == true);
        assert(attrs[4]["value"]["arrayValue"]["values"][1]["stringValue"] == "b");
        assert(span["events"][0]["timeUnixNano"] == "1500000000");
        assert(span["status"]["code"] == 2);
        assert(span["status"]["message"] == "boom");
    }
    std::cout << "  PASSED" << std::endl;

    httplib::Server server;
    std::mutex mutex;
    std::vector<Received> received;
    int status = 200;

    auto handler = [&](const httplib::Request& req, httplib::Response& res)
    {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(Received{req.path, req.get_header_value("Authorization"),
                                    req.get_header_value("User-Agent"),
                                    req.get_header_value("X-Extra"), req.body});
        res.status = status;
        res.set_content("{}", "application/json");
    };
    server.Post("/v1/traces", handler);
    server.Post("/v1/metrics", handler);

    int port = 18431;
    std::thread th([&]() { server.listen("127.0.0.1", port); });
    server.wait_until_ready();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    OtlpOptions options;
    options.base_url = "http://127.0.0.1:" + std::to_string(port) + "/";
    options.token = "pylf_v1_secret";
    options.service_name = "svc";
    options.extra_headers = {{"X-Extra", "yes"}};
    auto transport = std::make_shared<HttpTransport>(std::make_shared<HttplibBackend>());

    std::cout << "test_span_export_over_http..." << std::endl;
    {
        OtlpSpanExporter exporter(options, transport);
        assert(exporter.endpoint() == "http://127.0.0.1:" + std::to_string(port) + "/v1/traces");
        assert(exporter.export_spans({sample_span()}) == telemetry::ExportResult::Success);

        std::lock_guard<std::mutex> lock(mutex);
        assert(received.size() == 1);
        assert(received[0].path == "/v1/traces");
        assert(received[0].authorization == "pylf_v1_secret");
        assert(received[0].user_agent == std::string("logfirecpp/") + VERSION);
        assert(received[0].extra == "yes");
        auto body = Json::parse(received[0].body);
        assert(body["resourceSpans"][0]["scopeSpans"][0]["spans"][0]["name"] == "hello");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_metric_export_over_http..." << std::endl;
    {
        OtlpMetricExporter exporter(options, transport);
        metrics::MetricPoint counter;
        counter.name = "requests";
        counter.kind = metrics::InstrumentKind::Counter;
        counter.value = 5;
        counter.count = 2;
        metrics::MetricPoint hist;
        hist.name = "latency";
        hist.unit = "ms";
        hist.kind = metrics::InstrumentKind::Histogram;
        hist.count = 2;
        hist.sum = 30.0;
        hist.min = 10.0;
        hist.max = 20.0;
        assert(exporter.export_metrics({counter, hist}) == metrics::ExportResult::Success);

        std::lock_guard<std::mutex> lock(mutex);
        assert(received.size() == 2);
        assert(received[1].path == "/v1/metrics");
        auto body = Json::parse(received[1].body);
        const auto& list = body["resourceMetrics"][0]["scopeMetrics"][0]["metrics"];
        assert(list[0]["sum"]["dataPoints"][0]["asInt"] == "5");
        assert(list[0]["sum"]["isMonotonic"] == true);
        assert(list[1]["histogram"]["dataPoints"][0]["count"] == "2");
        assert(list[1]["histogram"]["dataPoints"][0]["max"] == 20.0);
        assert(list[1]["unit"] == "ms");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_non_2xx_raises_without_retry..." << std::endl;
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            status = 503;
            received.clear();
        }
        OtlpSpanExporter exporter(options, transport);
        bool threw = false;
        try
        {
            exporter.export_spans({sample_span()});
        }
        catch (const TransportError& e)
        {
            threw = std::string(e.what()).find("503") != std::string::npos;
        }
        assert(threw);
        std::lock_guard<std::mutex> lock(mutex);
        assert(received.size() == 1);
    }
    std::cout << "  PASSED" << std::endl;

    server.stop();
    if (th.joinable())
        th.join();

    std::cout << "test_unreachable_endpoint_raises..." << std::endl;
    {
        OtlpSpanExporter exporter(options, transport);
        bool threw = false;
        try
        {
            exporter.export_spans({sample_span()});
        }
        catch (const TransportError&)
        {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "All OTLP exporter tests passed!" << std::endl;
    return 0;
}
