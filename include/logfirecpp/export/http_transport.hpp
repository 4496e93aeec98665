#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace logfirecpp::exporting
{

using Headers = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest
{
    std::string url;
    Headers headers;
    std::string body;
    std::string content_type{"application/json"};
};

struct HttpResponse
{
    int status{0};
    std::string body;
};

/// The network call itself. Throws TransportError when no response is received.
class HttpBackend
{
  public:
    virtual ~HttpBackend() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/// cpp-httplib client. https needs CPPHTTPLIB_OPENSSL_SUPPORT at build time.
class HttplibBackend : public HttpBackend
{
  public:
    explicit HttplibBackend(std::chrono::milliseconds timeout = std::chrono::milliseconds{10000})
        : timeout_(timeout)
    {
    }

    HttpResponse send(const HttpRequest& request) override;

  private:
    std::chrono::milliseconds timeout_;
};

/// Produces the next chunk of a streamed body, or nullopt when done.
using ChunkSource = std::function<std::optional<std::string>()>;

/// Size-bounded POST. The body size is measured before anything reaches the backend;
/// a body of `max_body_size` bytes or more fails with BodyTooLargeError.
class HttpTransport
{
  public:
    static constexpr std::size_t DEFAULT_MAX_BODY_SIZE = 5 * 1024 * 1024;

    explicit HttpTransport(std::shared_ptr<HttpBackend> backend,
                           std::size_t max_body_size = DEFAULT_MAX_BODY_SIZE);

    HttpResponse post(const std::string& url, std::string body, const Headers& headers = {}) const;

    /// Pulls every chunk, summing sizes as they are produced; stops at the first
    /// chunk that crosses the limit.
    HttpResponse post_stream(const std::string& url, const ChunkSource& next,
                             const Headers& headers = {}) const;

    std::size_t max_body_size() const
    {
        return max_body_size_;
    }

  private:
    void check_size(std::size_t size) const;

    std::shared_ptr<HttpBackend> backend_;
    std::size_t max_body_size_;
};

} // namespace logfirecpp::exporting
