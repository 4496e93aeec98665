#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/export/fallback_exporter.hpp"
#include "logfirecpp/export/file_exporter.hpp"
#include "logfirecpp/export/otlp_exporter.hpp"
#include "logfirecpp/telemetry/batch_processor.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace logfirecpp;
using namespace logfirecpp::exporting;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace
{

class StatusBackend : public HttpBackend
{
  public:
    explicit StatusBackend(int status) : status_(status) {}

    HttpResponse send(const HttpRequest&) override
    {
        ++calls;
        return HttpResponse{status_, "unavailable"};
    }

    int calls{0};

  private:
    int status_;
};

class FailingExporter : public telemetry::SpanExporter
{
  public:
    telemetry::ExportResult export_spans(const std::vector<telemetry::SpanRecord>&) override
    {
        return telemetry::ExportResult::Failure;
    }
};

std::vector<telemetry::SpanRecord> batch(int n)
{
    std::vector<telemetry::SpanRecord> out(n);
    for (int i = 0; i < n; ++i)
    {
        out[i].name = "span " + std::to_string(i);
        out[i].context.trace_id = telemetry::TraceId{0, 1};
        out[i].context.span_id = static_cast<uint64_t>(i + 1);
    }
    return out;
}

fs::path temp_file(const std::string& name)
{
    auto p = fs::temp_directory_path() / ("logfirecpp_fallback_" + name + ".bin");
    fs::remove(p);
    return p;
}

} // namespace

int main()
{
    std::cout << "=== Fallback Exporter Tests ===" << std::endl;

    std::cout << "test_http_error_goes_to_disk..." << std::endl;
    {
        auto path = temp_file("http");
        auto backend = std::make_shared<StatusBackend>(503);
        auto otlp = std::make_shared<OtlpSpanExporter>(OtlpOptions{},
                                                       std::make_shared<HttpTransport>(backend));
        auto file = std::make_shared<FileSpanExporter>(path);
        FallbackSpanExporter exporter(otlp, file);

        assert(exporter.export_spans(batch(3)) == telemetry::ExportResult::Success);
        assert(backend->calls == 1);
        assert(exporter.fallback_count() == 1);
        auto payloads = read_fallback_file(path);
        assert(payloads.size() == 1);
        assert(Json::parse(payloads[0])["resourceSpans"][0]["scopeSpans"][0]["spans"].size() == 3);
        fs::remove(path);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_body_too_large_goes_to_disk..." << std::endl;
    {
        auto path = temp_file("large");
        auto backend = std::make_shared<StatusBackend>(200);
        auto otlp = std::make_shared<OtlpSpanExporter>(
            OtlpOptions{}, std::make_shared<HttpTransport>(backend, 10));
        FallbackSpanExporter exporter(otlp, std::make_shared<FileSpanExporter>(path));

        assert(exporter.export_spans(batch(1)) == telemetry::ExportResult::Success);
        assert(backend->calls == 0);
        assert(read_fallback_file(path).size() == 1);
        fs::remove(path);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_failure_result_goes_to_disk..." << std::endl;
    {
        auto path = temp_file("failure");
        FallbackSpanExporter exporter(std::make_shared<FailingExporter>(),
                                      std::make_shared<FileSpanExporter>(path));
        assert(exporter.export_spans(batch(2)) == telemetry::ExportResult::Success);
        assert(read_fallback_file(path).size() == 1);
        fs::remove(path);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_success_skips_disk..." << std::endl;
    {
        auto path = temp_file("success");
        auto backend = std::make_shared<StatusBackend>(200);
        auto otlp = std::make_shared<OtlpSpanExporter>(OtlpOptions{},
                                                       std::make_shared<HttpTransport>(backend));
        FallbackSpanExporter exporter(otlp, std::make_shared<FileSpanExporter>(path));
        assert(exporter.export_spans(batch(2)) == telemetry::ExportResult::Success);
        assert(backend->calls == 1);
        assert(exporter.fallback_count() == 0);
        assert(!fs::exists(path));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_batched_pipeline_defers_to_disk..." << std::endl;
    {
        auto path = temp_file("pipeline");
        auto backend = std::make_shared<StatusBackend>(500);
        auto otlp = std::make_shared<OtlpSpanExporter>(OtlpOptions{},
                                                       std::make_shared<HttpTransport>(backend));
        auto fallback =
            std::make_shared<FallbackSpanExporter>(otlp, std::make_shared<FileSpanExporter>(path));
        telemetry::BatchSpanProcessor processor(fallback, telemetry::BatchOptions{10s, 100, 100});
        for (const auto& r : batch(5))
            processor.on_end(r);
        processor.shutdown(3000ms);
        auto payloads = read_fallback_file(path);
        assert(payloads.size() == 1);
        assert(Json::parse(payloads[0])["resourceSpans"][0]["scopeSpans"][0]["spans"].size() == 5);
        fs::remove(path);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "All fallback exporter tests passed!" << std::endl;
    return 0;
}
