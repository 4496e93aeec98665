#pragma once
#include "logfirecpp/telemetry/processor.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace logfirecpp::exporting
{

class OtlpSpanExporter;

/// First bytes of every fallback file.
constexpr char FALLBACK_FILE_MAGIC[] = "LFSPANS1";
constexpr std::size_t FALLBACK_FILE_MAGIC_SIZE = 8;

/// Append-only durable store. Each batch is written as a 4-byte little-endian
/// length followed by the OTLP JSON payload, so the file is replayable in
/// write order and can keep growing across process restarts.
class FileSpanExporter : public telemetry::SpanExporter
{
  public:
    FileSpanExporter(std::filesystem::path path, std::string service_name = "unknown_service");

    /// Throws Error when the file cannot be written or is not a fallback file.
    telemetry::ExportResult export_spans(const std::vector<telemetry::SpanRecord>& batch) override;

    const std::filesystem::path& path() const
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
    std::string service_name_;
};

/// Payloads in write order. A missing file reads as empty; a truncated tail
/// is logged and skipped. Throws Error when the magic does not match.
std::vector<std::string> read_fallback_file(const std::filesystem::path& path);

/// Resends every stored payload through `exporter`, oldest first. The file is
/// first renamed to `<path>.replay`, so batches written meanwhile land in a
/// fresh `<path>` and wait for the next replay. An incomplete trailing batch is
/// appended to `<path>.partial` instead of being discarded. A failed send
/// propagates and leaves `<path>.replay` to be resumed by the next call.
std::size_t replay_fallback_file(const std::filesystem::path& path, OtlpSpanExporter& exporter);

} // namespace logfirecpp::exporting
