#include "logfirecpp/export/file_exporter.hpp"

#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/export/otlp_exporter.hpp"
#include "logfirecpp/export/otlp_json.hpp"
#include "logfirecpp/logging.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>

namespace logfirecpp::exporting
{
namespace
{

std::string encode_length(uint32_t n)
{
    std::string out(4, '\0');
    for (int i = 0; i < 4; ++i)
        out[i] = static_cast<char>((n >> (8 * i)) & 0xff);
    return out;
}

uint32_t decode_length(const char* bytes)
{
    uint32_t n = 0;
    for (int i = 0; i < 4; ++i)
        n |= static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << (8 * i);
    return n;
}

void check_magic(std::istream& in, const std::filesystem::path& path)
{
    std::string magic(FALLBACK_FILE_MAGIC_SIZE, '\0');
    in.read(&magic[0], static_cast<std::streamsize>(magic.size()));
    if (in.gcount() != static_cast<std::streamsize>(magic.size()) ||
        magic != std::string(FALLBACK_FILE_MAGIC, FALLBACK_FILE_MAGIC_SIZE))
        throw Error("Not a span fallback file: " + path.string());
}

/// One lock per fallback file, shared by every writer and by replay in this process.
std::mutex& path_mutex(const std::filesystem::path& path)
{
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<std::mutex>> registry;
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    auto key = (ec ? path : absolute).lexically_normal().string();
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& slot = registry[key];
    if (!slot)
        slot = std::make_unique<std::mutex>();
    return *slot;
}

std::filesystem::path with_suffix(const std::filesystem::path& path, const char* suffix)
{
    auto out = path;
    out += suffix;
    return out;
}

/// Complete payloads in write order. `consumed` receives the byte offset just
/// past the last complete batch.
std::vector<std::string> read_batches(const std::filesystem::path& path, std::uintmax_t& consumed)
{
    std::vector<std::string> payloads;
    consumed = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return payloads;
    if (in.peek() == std::char_traits<char>::eof())
        return payloads;
    check_magic(in, path);
    consumed = FALLBACK_FILE_MAGIC_SIZE;

    while (true)
    {
        char header[4];
        in.read(header, sizeof(header));
        if (in.gcount() == 0)
            break;
        if (in.gcount() != static_cast<std::streamsize>(sizeof(header)))
        {
            logging::logger()->warn("Truncated length prefix at the end of {}", path.string());
            break;
        }
        std::string payload(decode_length(header), '\0');
        in.read(&payload[0], static_cast<std::streamsize>(payload.size()));
        if (in.gcount() != static_cast<std::streamsize>(payload.size()))
        {
            logging::logger()->warn("Truncated batch at the end of {} ({} of {} bytes)",
                                    path.string(), in.gcount(), payload.size());
            break;
        }
        consumed += sizeof(header) + payload.size();
        payloads.push_back(std::move(payload));
    }
    return payloads;
}

/// Copies the bytes after `offset` to the end of `target`.
void preserve_tail(const std::filesystem::path& source, std::uintmax_t offset,
                   const std::filesystem::path& target)
{
    std::ifstream in(source, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(offset));
    std::string tail((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::ofstream out(target, std::ios::binary | std::ios::app);
    out.write(tail.data(), static_cast<std::streamsize>(tail.size()));
    out.flush();
    if (!out)
        throw Error("Failed to preserve incomplete batch in " + target.string());
    logging::logger()->warn("Kept {} bytes of an incomplete batch in {}", tail.size(),
                            target.string());
}

/// Sends every complete batch of a file already moved aside, then removes it.
/// A failed send propagates and leaves the file for the next replay.
std::size_t replay_pending(const std::filesystem::path& pending,
                           const std::filesystem::path& partial, OtlpSpanExporter& exporter)
{
    std::uintmax_t consumed = 0;
    auto payloads = read_batches(pending, consumed);
    for (const auto& payload : payloads)
        exporter.export_payload(payload);

    std::error_code ec;
    auto size = std::filesystem::file_size(pending, ec);
    if (!ec && size > consumed)
        preserve_tail(pending, consumed, partial);

    std::filesystem::remove(pending, ec);
    if (ec)
        logging::logger()->warn("Could not remove replayed fallback file {}: {}",
                                pending.string(), ec.message());
    return payloads.size();
}

} // namespace

FileSpanExporter::FileSpanExporter(std::filesystem::path path, std::string service_name)
    : path_(std::move(path)), service_name_(std::move(service_name))
{
}

telemetry::ExportResult
FileSpanExporter::export_spans(const std::vector<telemetry::SpanRecord>& batch)
{
    if (batch.empty())
        return telemetry::ExportResult::Success;
    auto payload = encode_spans(batch, service_name_).dump();
    if (payload.size() > UINT32_MAX)
        throw EncodingError("Span batch too large for the fallback file");

    std::lock_guard<std::mutex> lock(path_mutex(path_));
    std::error_code ec;
    bool fresh = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;
    if (!fresh)
    {
        std::ifstream in(path_, std::ios::binary);
        check_magic(in, path_);
    }
    else if (path_.has_parent_path())
    {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out)
        throw Error("Cannot open span fallback file: " + path_.string());
    if (fresh)
        out.write(FALLBACK_FILE_MAGIC, FALLBACK_FILE_MAGIC_SIZE);
    auto length = encode_length(static_cast<uint32_t>(payload.size()));
    out.write(length.data(), static_cast<std::streamsize>(length.size()));
    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out)
        throw Error("Failed to write span fallback file: " + path_.string());
    return telemetry::ExportResult::Success;
}

std::vector<std::string> read_fallback_file(const std::filesystem::path& path)
{
    std::uintmax_t consumed = 0;
    return read_batches(path, consumed);
}

std::size_t replay_fallback_file(const std::filesystem::path& path, OtlpSpanExporter& exporter)
{
    auto pending = with_suffix(path, ".replay");
    auto partial = with_suffix(path, ".partial");
    std::size_t sent = 0;

    // Leftover from a replay that failed part way.
    std::error_code ec;
    if (std::filesystem::exists(pending, ec))
        sent += replay_pending(pending, partial, exporter);

    {
        // Writers append to a fresh file once this one is moved aside.
        std::lock_guard<std::mutex> lock(path_mutex(path));
        if (!std::filesystem::exists(path, ec))
        {
            logging::logger()->info("Replayed {} span batches from {}", sent, path.string());
            return sent;
        }
        std::filesystem::rename(path, pending, ec);
        if (ec)
            throw Error("Cannot move fallback file " + path.string() + " aside: " + ec.message());
    }

    sent += replay_pending(pending, partial, exporter);
    logging::logger()->info("Replayed {} span batches from {}", sent, path.string());
    return sent;
}

} // namespace logfirecpp::exporting
