#pragma once

#include "remote/MediaServerClient.hpp"
#include "utils/Cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kc::remote
{

struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    std::optional<std::uint64_t> range_start;
    // Streaming requests abort on a stalled transfer instead of a total
    // deadline, since a full video can take longer than any fixed timeout.
    bool streaming = false;
    // Called once with the status and headers before the first body chunk
    // of a successful (2xx) response.
    std::function<void(long status,
                       std::map<std::string, std::string> const &headers)>
        on_response;
    // When set, a 2xx body goes here instead of HttpResponse::body.
    // Returning false aborts the transfer as cancelled.
    std::function<bool(std::span<char const>)> on_body;
    utils::CancellationToken cancel;
};

struct HttpResponse
{
    RemoteError error;
    long status = 0;
    std::string body;
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    std::uint64_t body_bytes = 0;
};

struct CertificateInfo
{
    RemoteError error;
    bool verified = false;
    std::string pem;
};

class HttpClient
{
  public:
    struct Options
    {
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds timeout{20};
        std::string user_agent = "KidCache";
    };

    explicit HttpClient(Options options);

    // Pin in curl's "sha256//<base64>" form; empty restores CA checks.
    void set_pinned_public_key(std::string pin);
    std::string const &pinned_public_key() const noexcept
    {
        return pinned_key_;
    }

    HttpResponse perform(HttpRequest const &request) const;

    // Fetches the leaf certificate of `url`. `verified` is true when the
    // chain passed the system trust store.
    CertificateInfo fetch_certificate(std::string const &url) const;

  private:
    Options options_;
    std::string pinned_key_;
};

// Maps an HTTP status to the error kind callers react to.
RemoteErrorKind classify_http_status(long status) noexcept;

} // namespace kc::remote
