#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/telemetry/batch_processor.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace logfirecpp;
using namespace logfirecpp::telemetry;
using namespace std::chrono_literals;

namespace
{

class RecordingExporter : public SpanExporter
{
  public:
    ExportResult export_spans(const std::vector<SpanRecord>& batch) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ++calls_;
        gate_cv_.wait(lock, [&] { return open_; });
        batches_.push_back(batch);
        exporting_thread_ = std::this_thread::get_id();
        if (fail_)
            throw TransportError("connection refused");
        return ExportResult::Success;
    }

    void shutdown() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++shutdown_calls_;
    }

    size_t total() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& b : batches_)
            n += b.size();
        return n;
    }

    size_t calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t batch_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return batches_.size();
    }

    std::thread::id exporting_thread() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return exporting_thread_;
    }

    bool was_shut_down() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_calls_ > 0;
    }

    size_t shutdown_calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_calls_;
    }

    void set_open(bool open)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = open;
        }
        gate_cv_.notify_all();
    }

    void set_fail(bool fail)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    std::vector<std::vector<SpanRecord>> batches_;
    std::thread::id exporting_thread_;
    size_t calls_{0};
    bool open_{true};
    bool fail_{false};
    size_t shutdown_calls_{0};
};

SpanRecord record(const std::string& name)
{
    SpanRecord r;
    r.name = name;
    r.kind = SpanKind::Log;
    return r;
}

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit = 3000ms)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

int main()
{
    std::cout << "=== Batch Span Processor Tests ===" << std::endl;

    std::cout << "test_force_flush_exports_queued..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        BatchSpanProcessor processor(exporter, BatchOptions{10s, 100, 10});
        processor.on_end(record("a"));
        processor.on_end(record("b"));
        assert(exporter->total() == 0);
        assert(processor.force_flush(3000ms));
        assert(exporter->total() == 2);
        assert(exporter->exporting_thread() != std::this_thread::get_id());
        processor.shutdown(1000ms);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_size_threshold_triggers_export..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        BatchSpanProcessor processor(exporter, BatchOptions{10s, 100, 3});
        for (int i = 0; i < 3; ++i)
            processor.on_end(record("r" + std::to_string(i)));
        assert(wait_until([&] { return exporter->total() == 3; }));
        assert(exporter->batch_count() == 1);
        processor.shutdown(1000ms);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_timer_triggers_export..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        BatchSpanProcessor processor(exporter, BatchOptions{50ms, 100, 100});
        processor.on_end(record("lonely"));
        assert(wait_until([&] { return exporter->total() == 1; }));
        processor.shutdown(1000ms);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_batches_respect_max_size..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        BatchSpanProcessor processor(exporter, BatchOptions{10s, 100, 4});
        exporter->set_open(false);
        for (int i = 0; i < 10; ++i)
            processor.on_end(record("r"));
        exporter->set_open(true);
        assert(processor.force_flush(3000ms));
        assert(exporter->total() == 10);
        assert(exporter->batch_count() == 3);
        processor.shutdown(1000ms);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_queue_overflow_drops..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        BatchSpanProcessor processor(exporter, BatchOptions{10s, 2, 2});
        exporter->set_open(false);
        processor.on_end(record("1"));
        processor.on_end(record("2"));
        // The worker takes the first full batch and blocks in the exporter.
        assert(wait_until([&] { return exporter->calls() == 1; }));
        processor.on_end(record("3"));
        processor.on_end(record("4"));
        processor.on_end(record("5"));
        assert(processor.dropped_count() == 1);
        exporter->set_open(true);
        assert(processor.force_flush(3000ms));
        assert(exporter->total() == 4);
        processor.shutdown(1000ms);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_exporter_errors_contained..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        exporter->set_fail(true);
        BatchSpanProcessor processor(exporter, BatchOptions{10s, 100, 10});
        processor.on_end(record("x"));
        assert(processor.force_flush(3000ms));
        assert(exporter->total() == 1);
        processor.shutdown(1000ms);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_shutdown_flushes_and_late_records_exported..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        BatchSpanProcessor processor(exporter, BatchOptions{10s, 100, 50});
        processor.on_end(record("queued"));
        processor.shutdown(3000ms);
        assert(exporter->total() == 1);
        assert(exporter->was_shut_down());

        processor.on_end(record("late"));
        assert(exporter->total() == 2);
        assert(exporter->exporting_thread() == std::this_thread::get_id());
        processor.shutdown(1000ms);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_concurrent_shutdown_runs_once..." << std::endl;
    {
        auto exporter = std::make_shared<RecordingExporter>();
        BatchSpanProcessor processor(exporter, BatchOptions{10s, 100, 50});
        exporter->set_open(false);
        processor.on_end(record("pending"));

        std::thread first([&] { processor.shutdown(3000ms); });
        assert(wait_until([&] { return exporter->calls() == 1; }));

        std::vector<std::thread> others;
        for (int i = 0; i < 3; ++i)
            others.emplace_back([&] { processor.shutdown(1000ms); });
        for (auto& t : others)
            t.join();

        exporter->set_open(true);
        first.join();
        assert(exporter->total() == 1);
        assert(exporter->shutdown_calls() == 1);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "All batch span processor tests passed!" << std::endl;
    return 0;
}
