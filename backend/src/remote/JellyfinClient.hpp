#pragma once

#include "remote/HttpClient.hpp"
#include "remote/MediaServerClient.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kc::remote
{

// MediaServerClient for a Jellyfin server. Credentials given to
// authenticate() are kept in memory only, for one silent re-authentication
// when the server rejects the token.
class JellyfinClient final : public MediaServerClient
{
  public:
    struct Identity
    {
        std::string client = "Kid Player";
        std::string device = "KidCache";
        std::string device_id;
        std::string version = "1.0.0";
    };

    JellyfinClient(Identity identity, HttpClient::Options options);

    void set_endpoint(std::string base_url,
                      std::string pinned_public_key) override;
    AuthResult authenticate(std::string const &username,
                            std::string const &password) override;
    std::optional<AuthSession> session() const override;
    void restore_session(AuthSession session) override;

    ItemPage list_items(std::string const &library_id, int start_index,
                        int limit,
                        utils::CancellationToken const &cancel) override;
    std::string stream_url(std::string const &item_id) const override;
    DownloadResult download(DownloadRequest const &request) override;
    RemoteError report_played(std::string const &item_id,
                              std::int64_t position_ticks) override;
    CertificateProbe probe_certificate(std::string const &base_url) override;

  private:
    using RequestBuilder =
        std::function<HttpRequest(std::string const &base_url,
                                  AuthSession const &session)>;

    std::string authorization_header(std::string const &token) const;
    std::optional<RemoteError> check_endpoint(std::string const &url) const;
    // Runs an authorized request, re-authenticating once on a 401.
    HttpResponse send_authorized(RequestBuilder const &build);
    HttpClient http_snapshot() const;

    Identity identity_;

    mutable std::mutex mutex_;
    HttpClient http_;
    std::string base_url_;
    std::optional<AuthSession> session_;
    std::optional<std::pair<std::string, std::string>> credentials_;
};

// Total file size from a download response's headers. `offset` is the
// requested range start.
std::optional<std::uint64_t>
download_total_size(long status,
                    std::map<std::string, std::string> const &headers,
                    std::uint64_t offset);

// Parses one page of /Users/{id}/Items. Entries without an id are dropped.
ItemPage parse_item_page(std::string_view body, std::string const &base_url,
                         std::string const &library_id, int start_index);

} // namespace kc::remote
