#include "logfirecpp/export/http_transport.hpp"

#include "logfirecpp/exceptions.hpp"
#include "logfirecpp/logging.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace logfirecpp::exporting
{
namespace
{

struct ParsedUrl
{
    std::string scheme; // "http" or "https"
    std::string host;
    int port;
    std::string path; // includes leading '/'
};

ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl result;
    std::string remaining = url;

    auto scheme_pos = remaining.find("://");
    if (scheme_pos != std::string::npos)
    {
        result.scheme = remaining.substr(0, scheme_pos);
        remaining = remaining.substr(scheme_pos + 3);
    }
    else
    {
        result.scheme = "http";
    }

    if (result.scheme != "http" && result.scheme != "https")
        throw TransportError("Unsupported URL scheme: " + result.scheme +
                             " (only http and https are allowed)");

    auto slash_pos = remaining.find('/');
    if (slash_pos != std::string::npos)
    {
        result.path = remaining.substr(slash_pos);
        remaining = remaining.substr(0, slash_pos);
    }
    else
    {
        result.path = "/";
    }

    const int default_port = result.scheme == "https" ? 443 : 80;
    auto colon_pos = remaining.rfind(':');
    if (colon_pos != std::string::npos)
    {
        result.host = remaining.substr(0, colon_pos);
        try
        {
            result.port = std::stoi(remaining.substr(colon_pos + 1));
        }
        catch (const std::exception&)
        {
            throw TransportError("Invalid port in URL: " + url);
        }
    }
    else
    {
        result.host = remaining;
        result.port = default_port;
    }
    return result;
}

} // namespace

HttpResponse HttplibBackend::send(const HttpRequest& request)
{
    auto url = parse_url(request.url);
    std::string origin = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    httplib::Client cli(origin);

    auto seconds = static_cast<time_t>(timeout_.count() / 1000);
    auto usec = static_cast<time_t>((timeout_.count() % 1000) * 1000);
    cli.set_connection_timeout(seconds, usec);
    cli.set_read_timeout(seconds, usec);
    cli.set_write_timeout(seconds, usec);
    cli.set_follow_location(false);

    httplib::Headers headers;
    for (const auto& [name, value] : request.headers)
        headers.emplace(name, value);

    auto res = cli.Post(url.path, headers, request.body, request.content_type);
    if (!res)
        throw TransportError("HTTP request to " + request.url +
                             " failed: " + httplib::to_string(res.error()));
    return HttpResponse{res->status, res->body};
}

HttpTransport::HttpTransport(std::shared_ptr<HttpBackend> backend, std::size_t max_body_size)
    : backend_(backend ? std::move(backend) : std::make_shared<HttplibBackend>()),
      max_body_size_(max_body_size)
{
}

void HttpTransport::check_size(std::size_t size) const
{
    if (size >= max_body_size_)
        throw BodyTooLargeError(size, max_body_size_);
}

HttpResponse HttpTransport::post(const std::string& url, std::string body,
                                 const Headers& headers) const
{
    check_size(body.size());
    logging::logger()->debug("POST {} ({} bytes)", url, body.size());
    return backend_->send(HttpRequest{url, headers, std::move(body)});
}

HttpResponse HttpTransport::post_stream(const std::string& url, const ChunkSource& next,
                                        const Headers& headers) const
{
    std::string body;
    while (auto chunk = next())
    {
        check_size(body.size() + chunk->size());
        body += *chunk;
    }
    logging::logger()->debug("POST {} ({} bytes, streamed)", url, body.size());
    return backend_->send(HttpRequest{url, headers, std::move(body)});
}

} // namespace logfirecpp::exporting
