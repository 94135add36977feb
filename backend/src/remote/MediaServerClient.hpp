#pragma once

#include "utils/Cancellation.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kc::remote
{

enum class RemoteErrorKind
{
    None,
    // Timeouts, resets, 5xx. Retried with backoff by callers.
    Transient,
    // Token rejected even after the silent re-authentication.
    AuthExpired,
    NotFound,
    // TLS peer did not match the system trust store or the pinned key.
    Untrusted,
    Cancelled,
    // 416 on a resumed download: the offset is at or past the end of the
    // file. DownloadResult::total_size carries the server's size if known.
    RangeNotSatisfiable,
    Protocol,
};

struct RemoteError
{
    RemoteErrorKind kind = RemoteErrorKind::None;
    std::string message;
    long http_status = 0;

    bool ok() const noexcept
    {
        return kind == RemoteErrorKind::None;
    }
};

struct RemoteItem
{
    std::string id;
    std::string title;
    std::string artwork_url;
    std::int64_t duration_ticks = 0;
    std::int64_t added_at = 0;
    std::int64_t modified_at = 0;
    std::string library_id;
    std::string series_name;
    int season_index = 0;
    int episode_index = 0;
    std::optional<std::int64_t> resume_position_ticks;
};

struct AuthSession
{
    std::string token;
    std::string user_id;
    std::string server_id;
};

struct AuthResult
{
    RemoteError error;
    AuthSession session;
};

struct ItemPage
{
    RemoteError error;
    std::vector<RemoteItem> items;
    std::int64_t total_count = 0;
};

// Reported once, before the first chunk of a download body.
struct DownloadStart
{
    // False when a ranged request was answered with the full body; the
    // receiver must discard what it already has.
    bool range_honoured = true;
    // Size of the complete file when the server reported one.
    std::optional<std::uint64_t> total_size;
};

struct DownloadRequest
{
    std::string item_id;
    // Resume offset; 0 requests the whole file.
    std::uint64_t offset = 0;
    std::function<void(DownloadStart const &)> on_start;
    // Returning false aborts the transfer as cancelled.
    std::function<bool(std::span<char const>)> on_data;
    utils::CancellationToken cancel;
};

struct DownloadResult
{
    RemoteError error;
    // False when a ranged request was answered with the full body.
    bool range_honoured = true;
    // Size of the complete file when the server reported one.
    std::optional<std::uint64_t> total_size;
    std::optional<std::string> sha256;
    std::uint64_t bytes_received = 0;
};

struct CertificateProbe
{
    RemoteError error;
    bool trusted_by_system = false;
    std::string public_key_pin;
};

class MediaServerClient
{
  public:
    virtual ~MediaServerClient() = default;

    // An empty pin means normal CA verification.
    virtual void set_endpoint(std::string base_url,
                              std::string pinned_public_key) = 0;
    virtual AuthResult authenticate(std::string const &username,
                                    std::string const &password) = 0;
    virtual std::optional<AuthSession> session() const = 0;
    virtual void restore_session(AuthSession session) = 0;

    virtual ItemPage list_items(std::string const &library_id, int start_index,
                                int limit,
                                utils::CancellationToken const &cancel) = 0;
    // Built locally; never touches the network.
    virtual std::string stream_url(std::string const &item_id) const = 0;
    virtual DownloadResult download(DownloadRequest const &request) = 0;
    virtual RemoteError report_played(std::string const &item_id,
                                      std::int64_t position_ticks) = 0;
    virtual CertificateProbe probe_certificate(std::string const &base_url) = 0;
};

} // namespace kc::remote
