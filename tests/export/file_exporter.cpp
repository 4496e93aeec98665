#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/export/file_exporter.hpp"
#include "logfirecpp/export/otlp_exporter.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace logfirecpp;
using namespace logfirecpp::exporting;
namespace fs = std::filesystem;

namespace
{

class CapturingBackend : public HttpBackend
{
  public:
    HttpResponse send(const HttpRequest& request) override
    {
        if (on_send)
            on_send();
        if (fail_next)
        {
            fail_next = false;
            return HttpResponse{503, "unavailable"};
        }
        requests.push_back(request);
        return HttpResponse{200, "{}"};
    }

    std::vector<HttpRequest> requests;
    std::function<void()> on_send;
    bool fail_next{false};
};

std::vector<telemetry::SpanRecord> batch_of(const std::string& name, int n)
{
    std::vector<telemetry::SpanRecord> out;
    for (int i = 0; i < n; ++i)
    {
        telemetry::SpanRecord r;
        r.name = name;
        r.context = telemetry::SpanContext{telemetry::TraceId{0, 1}, static_cast<uint64_t>(i + 1)};
        r.start_time = 1;
        r.end_time = 2;
        out.push_back(r);
    }
    return out;
}

fs::path temp_file(const std::string& name)
{
    auto p = fs::temp_directory_path() / ("logfirecpp_" + name + ".bin");
    fs::remove(p);
    fs::remove(fs::path(p.string() + ".replay"));
    fs::remove(fs::path(p.string() + ".partial"));
    return p;
}

std::string span_name(const std::string& payload)
{
    return Json::parse(payload)["resourceSpans"][0]["scopeSpans"][0]["spans"][0]["name"].get<std::string>();
}

std::shared_ptr<OtlpSpanExporter> otlp_for(const std::shared_ptr<CapturingBackend>& backend)
{
    OtlpOptions options;
    options.base_url = "http://localhost:4318";
    options.token = "secret";
    return std::make_shared<OtlpSpanExporter>(options, std::make_shared<HttpTransport>(backend));
}

} // namespace

int main()
{
    std::cout << "=== Fallback File Tests ===" << std::endl;

    std::cout << "test_append_and_read_in_order..." << std::endl;
    {
        auto path = temp_file("append");
        FileSpanExporter exporter(path, "svc");
        assert(exporter.export_spans(batch_of("first", 2)) == telemetry::ExportResult::Success);
        // A second exporter on the same file appends after a restart.
        FileSpanExporter reopened(path, "svc");
        reopened.export_spans(batch_of("second", 1));

        auto payloads = read_fallback_file(path);
        assert(payloads.size() == 2);
        auto first = Json::parse(payloads[0]);
        auto spans = first["resourceSpans"][0]["scopeSpans"][0]["spans"];
        assert(spans.size() == 2);
        assert(spans[0]["name"] == "first");
        assert(Json::parse(payloads[1])["resourceSpans"][0]["scopeSpans"][0]["spans"][0]["name"] ==
               "second");

        std::ifstream in(path, std::ios::binary);
        std::string magic(8, '\0');
        in.read(&magic[0], 8);
        assert(magic == "LFSPANS1");
        fs::remove(path);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_truncated_tail_skipped..." << std::endl;
    {
        auto path = temp_file("truncated");
        FileSpanExporter exporter(path);
        exporter.export_spans(batch_of("a", 1));
        exporter.export_spans(batch_of("b", 1));
        fs::resize_file(path, fs::file_size(path) - 3);
        auto payloads = read_fallback_file(path);
        assert(payloads.size() == 1);
        fs::remove(path);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_missing_file_reads_empty..." << std::endl;
    {
        auto path = temp_file("missing");
        assert(read_fallback_file(path).empty());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_foreign_file_rejected..." << std::endl;
    {
        auto path = temp_file("foreign");
        {
            std::ofstream out(path, std::ios::binary);
            out << "not a span file";
        }
        bool threw = false;
        try
        {
            read_fallback_file(path);
        }
        catch (const Error&)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        FileSpanExporter exporter(path);
        try
        {
            exporter.export_spans(batch_of("x", 1));
        }
        catch (const Error&)
        {
            threw = true;
        }
        assert(threw);
        fs::remove(path);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_replay_resends_and_removes..." << std::endl;
    {
        auto path = temp_file("replay");
        FileSpanExporter store(path);
        store.export_spans(batch_of("one", 1));
        store.export_spans(batch_of("two", 1));

        auto backend = std::make_shared<CapturingBackend>();
        OtlpOptions options;
        options.base_url = "http://localhost:4318";
        options.token = "secret";
        OtlpSpanExporter otlp(options, std::make_shared<HttpTransport>(backend));

        assert(replay_fallback_file(path, otlp) == 2);
        assert(backend->requests.size() == 2);
        assert(backend->requests[0].url == "http://localhost:4318/v1/traces");
        assert(Json::parse(backend->requests[1].body)["resourceSpans"][0]["scopeSpans"][0]["spans"]
                   [0]["name"] == "two");
        assert(!fs::exists(path));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_batches_written_during_replay_survive..." << std::endl;
    {
        auto path = temp_file("replay_concurrent");
        FileSpanExporter store(path);
        store.export_spans(batch_of("one", 1));
        store.export_spans(batch_of("two", 1));

        auto backend = std::make_shared<CapturingBackend>();
        bool appended = false;
        backend->on_send = [&]()
        {
            if (!appended)
            {
                appended = true;
                store.export_spans(batch_of("late", 1));
            }
        };
        auto otlp = otlp_for(backend);

        assert(replay_fallback_file(path, *otlp) == 2);
        assert(backend->requests.size() == 2);
        assert(!fs::exists(path.string() + ".replay"));

        auto remaining = read_fallback_file(path);
        assert(remaining.size() == 1);
        assert(span_name(remaining[0]) == "late");

        backend->on_send = nullptr;
        assert(replay_fallback_file(path, *otlp) == 1);
        assert(span_name(backend->requests[2].body) == "late");
        assert(!fs::exists(path));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_incomplete_tail_kept_on_replay..." << std::endl;
    {
        auto path = temp_file("replay_truncated");
        FileSpanExporter store(path);
        store.export_spans(batch_of("a", 1));
        auto complete = fs::file_size(path);
        store.export_spans(batch_of("b", 1));
        auto full = fs::file_size(path);
        fs::resize_file(path, full - 3);

        auto backend = std::make_shared<CapturingBackend>();
        auto otlp = otlp_for(backend);
        assert(replay_fallback_file(path, *otlp) == 1);
        assert(backend->requests.size() == 1);
        assert(!fs::exists(path));

        fs::path partial(path.string() + ".partial");
        assert(fs::exists(partial));
        assert(fs::file_size(partial) == full - 3 - complete);
        fs::remove(partial);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_failed_replay_resumes..." << std::endl;
    {
        auto path = temp_file("replay_resume");
        FileSpanExporter store(path);
        store.export_spans(batch_of("one", 1));

        auto backend = std::make_shared<CapturingBackend>();
        backend->fail_next = true;
        auto otlp = otlp_for(backend);
        bool threw = false;
        try
        {
            replay_fallback_file(path, *otlp);
        }
        catch (const TransportError&)
        {
            threw = true;
        }
        assert(threw);
        assert(fs::exists(path.string() + ".replay"));

        store.export_spans(batch_of("two", 1));
        assert(replay_fallback_file(path, *otlp) == 2);
        assert(span_name(backend->requests[0].body) == "one");
        assert(span_name(backend->requests[1].body) == "two");
        assert(!fs::exists(path) && !fs::exists(path.string() + ".replay"));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "All fallback file tests passed!" << std::endl;
    return 0;
}
