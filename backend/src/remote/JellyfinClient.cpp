#include "remote/JellyfinClient.hpp"

#include "utils/Clock.hpp"
#include "utils/Crypto.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <charconv>
#include <cstdio>
#include <utility>

namespace kc::remote
{

namespace
{

constexpr char const *kNotHttps = "only https:// servers are supported";

std::string url_encode(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value)
    {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
            c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string quote_field(std::string_view value)
{
    std::string out;
    for (char c : value)
    {
        if (c != '"')
        {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::uint64_t> parse_u64(std::string_view text)
{
    std::uint64_t value = 0;
    auto const *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr == text.data())
    {
        return std::nullopt;
    }
    return value;
}

RemoteItem parse_item(yyjson_val *item, std::string const &base_url,
                      std::string const &library_id)
{
    RemoteItem out;
    out.id = json::string_member(item, "Id").value_or("");
    out.title = json::string_member(item, "Name").value_or("");
    out.duration_ticks = json::int_member(item, "RunTimeTicks").value_or(0);
    if (auto created = json::string_member(item, "DateCreated"))
    {
        out.added_at = utils::parse_iso8601_seconds(*created).value_or(0);
    }
    if (auto modified = json::string_member(item, "DateModified"))
    {
        out.modified_at = utils::parse_iso8601_seconds(*modified).value_or(0);
    }
    if (out.modified_at == 0)
    {
        out.modified_at = out.added_at;
    }
    out.library_id = library_id;
    out.series_name = json::string_member(item, "SeriesName").value_or("");
    out.season_index = static_cast<int>(
        json::int_member(item, "ParentIndexNumber").value_or(0));
    out.episode_index =
        static_cast<int>(json::int_member(item, "IndexNumber").value_or(0));
    if (auto *user_data = json::object_member(item, "UserData"))
    {
        out.resume_position_ticks =
            json::int_member(user_data, "PlaybackPositionTicks");
    }
    if (auto *tags = json::object_member(item, "ImageTags"))
    {
        if (auto primary = json::string_member(tags, "Primary"))
        {
            out.artwork_url = base_url + "/Items/" + url_encode(out.id) +
                              "/Images/Primary?tag=" + url_encode(*primary);
        }
    }
    return out;
}

} // namespace

std::optional<std::uint64_t>
download_total_size(long status,
                    std::map<std::string, std::string> const &headers,
                    std::uint64_t offset)
{
    if (auto it = headers.find("content-range"); it != headers.end())
    {
        // bytes 100-999/1000
        auto const slash = it->second.rfind('/');
        if (slash != std::string::npos)
        {
            if (auto total = parse_u64(
                    std::string_view(it->second).substr(slash + 1)))
            {
                return total;
            }
        }
    }
    auto it = headers.find("content-length");
    if (it == headers.end())
    {
        return std::nullopt;
    }
    auto length = parse_u64(it->second);
    if (!length)
    {
        return std::nullopt;
    }
    return status == 206 ? *length + offset : *length;
}

ItemPage parse_item_page(std::string_view body, std::string const &base_url,
                         std::string const &library_id, int start_index)
{
    ItemPage page;
    auto parsed = json::Document::parse(body);
    auto *root = parsed.root();
    auto *items = root ? yyjson_obj_get(root, "Items") : nullptr;
    if (items == nullptr || !yyjson_is_arr(items))
    {
        page.error = {RemoteErrorKind::Protocol, "malformed item listing", 0};
        return page;
    }
    size_t idx = 0;
    size_t max = 0;
    yyjson_val *item = nullptr;
    yyjson_arr_foreach(items, idx, max, item)
    {
        if (!yyjson_is_obj(item))
        {
            continue;
        }
        auto remote = parse_item(item, base_url, library_id);
        if (!remote.id.empty())
        {
            page.items.push_back(std::move(remote));
        }
    }
    page.total_count = json::int_member(root, "TotalRecordCount")
                           .value_or(start_index +
                                     static_cast<std::int64_t>(max));
    return page;
}

JellyfinClient::JellyfinClient(Identity identity, HttpClient::Options options)
    : identity_(std::move(identity)), http_(std::move(options))
{
}

void JellyfinClient::set_endpoint(std::string base_url,
                                  std::string pinned_public_key)
{
    while (!base_url.empty() && base_url.back() == '/')
    {
        base_url.pop_back();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (base_url != base_url_)
    {
        session_.reset();
    }
    base_url_ = std::move(base_url);
    http_.set_pinned_public_key(std::move(pinned_public_key));
}

std::optional<AuthSession> JellyfinClient::session() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

void JellyfinClient::restore_session(AuthSession session)
{
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = std::move(session);
}

HttpClient JellyfinClient::http_snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return http_;
}

std::optional<RemoteError>
JellyfinClient::check_endpoint(std::string const &url) const
{
    if (url.empty())
    {
        return RemoteError{RemoteErrorKind::Protocol, "no server configured",
                           0};
    }
    if (!url.starts_with("https://"))
    {
        return RemoteError{RemoteErrorKind::Protocol, kNotHttps, 0};
    }
    return std::nullopt;
}

std::string
JellyfinClient::authorization_header(std::string const &token) const
{
    std::string header = "X-Emby-Authorization: MediaBrowser Client=\"" +
                         quote_field(identity_.client) + "\", Device=\"" +
                         quote_field(identity_.device) + "\", DeviceId=\"" +
                         quote_field(identity_.device_id) + "\", Version=\"" +
                         quote_field(identity_.version) + "\"";
    if (!token.empty())
    {
        header += ", Token=\"" + quote_field(token) + "\"";
    }
    return header;
}

AuthResult JellyfinClient::authenticate(std::string const &username,
                                        std::string const &password)
{
    AuthResult result;
    std::string base;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        base = base_url_;
    }
    if (auto bad = check_endpoint(base))
    {
        result.error = *bad;
        return result;
    }

    json::MutableDocument body;
    auto *root = body.make_root_object();
    auto *doc = body.doc();
    yyjson_mut_obj_add_strncpy(doc, root, "Username", username.data(),
                               username.size());
    yyjson_mut_obj_add_strncpy(doc, root, "Pw", password.data(),
                               password.size());

    HttpRequest request;
    request.method = "POST";
    request.url = base + "/Users/AuthenticateByName";
    request.headers = {authorization_header({}),
                       "Content-Type: application/json",
                       "Accept: application/json"};
    request.body = body.write();

    auto response = http_snapshot().perform(request);
    if (!response.error.ok())
    {
        result.error = response.error;
        if (response.status == 401)
        {
            result.error.message = "invalid username or password";
        }
        return result;
    }

    auto parsed = json::Document::parse(response.body);
    auto *payload = parsed.root();
    auto token = json::string_member(payload, "AccessToken");
    auto user_id = json::string_member(json::object_member(payload, "User"), "Id");
    if (!token || !user_id)
    {
        result.error = {RemoteErrorKind::Protocol,
                        "malformed authentication response", response.status};
        return result;
    }
    result.session.token = std::move(*token);
    result.session.user_id = std::move(*user_id);
    result.session.server_id =
        json::string_member(payload, "ServerId").value_or("");

    std::lock_guard<std::mutex> lock(mutex_);
    session_ = result.session;
    credentials_ = std::make_pair(username, password);
    KC_LOG_INFO("remote: signed in as user {}", result.session.user_id);
    return result;
}

HttpResponse JellyfinClient::send_authorized(RequestBuilder const &build)
{
    std::string base;
    std::optional<AuthSession> current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        base = base_url_;
        current = session_;
    }
    HttpResponse response;
    if (auto bad = check_endpoint(base))
    {
        response.error = *bad;
        return response;
    }
    if (!current)
    {
        response.error = {RemoteErrorKind::AuthExpired, "not signed in", 0};
        return response;
    }

    response = http_snapshot().perform(build(base, *current));
    if (response.error.kind != RemoteErrorKind::AuthExpired)
    {
        return response;
    }

    std::optional<std::pair<std::string, std::string>> credentials;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        credentials = credentials_;
    }
    if (!credentials)
    {
        return response;
    }
    KC_LOG_INFO("remote: token rejected, re-authenticating");
    auto renewed = authenticate(credentials->first, credentials->second);
    if (!renewed.error.ok())
    {
        if (renewed.error.kind == RemoteErrorKind::AuthExpired)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_.reset();
            credentials_.reset();
        }
        response.error = renewed.error;
        return response;
    }
    response = http_snapshot().perform(build(base, renewed.session));
    if (response.error.kind == RemoteErrorKind::AuthExpired)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.reset();
    }
    return response;
}

ItemPage JellyfinClient::list_items(std::string const &library_id,
                                    int start_index, int limit,
                                    utils::CancellationToken const &cancel)
{
    ItemPage page;
    auto response = send_authorized(
        [&](std::string const &base, AuthSession const &session)
        {
            HttpRequest request;
            request.url = base + "/Users/" + url_encode(session.user_id) +
                          "/Items?IncludeItemTypes=Movie,Episode"
                          "&Recursive=true&EnableUserData=true"
                          "&Fields=DateCreated,DateModified"
                          "&SortBy=DateCreated&SortOrder=Descending"
                          "&StartIndex=" +
                          std::to_string(start_index) +
                          "&Limit=" + std::to_string(limit);
            if (!library_id.empty())
            {
                request.url += "&ParentId=" + url_encode(library_id);
            }
            request.headers = {"X-Emby-Token: " + session.token,
                               "Accept: application/json"};
            request.cancel = cancel;
            return request;
        });
    if (!response.error.ok())
    {
        page.error = response.error;
        return page;
    }

    std::string base;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        base = base_url_;
    }
    page = parse_item_page(response.body, base, library_id, start_index);
    if (!page.error.ok())
    {
        page.error.http_status = response.status;
    }
    return page;
}

std::string JellyfinClient::stream_url(std::string const &item_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string url = base_url_ + "/Videos/" + url_encode(item_id) +
                      "/stream?Static=true";
    if (session_)
    {
        url += "&api_key=" + url_encode(session_->token);
    }
    return url;
}

DownloadResult JellyfinClient::download(DownloadRequest const &request)
{
    DownloadResult result;
    bool started = false;
    auto response = send_authorized(
        [&](std::string const &base, AuthSession const &session)
        {
            HttpRequest http;
            http.url = base + "/Items/" + url_encode(request.item_id) +
                       "/Download";
            http.headers = {"X-Emby-Token: " + session.token};
            if (request.offset > 0)
            {
                http.range_start = request.offset;
            }
            http.streaming = true;
            http.cancel = request.cancel;
            http.on_response =
                [&](long status,
                    std::map<std::string, std::string> const &headers)
            {
                started = true;
                result.range_honoured = request.offset == 0 || status == 206;
                result.total_size =
                    download_total_size(status, headers,
                                        result.range_honoured ? request.offset
                                                              : 0);
                if (request.on_start)
                {
                    request.on_start(
                        DownloadStart{result.range_honoured, result.total_size});
                }
            };
            http.on_body = [&](std::span<char const> chunk)
            {
                return request.on_data ? request.on_data(chunk) : true;
            };
            return http;
        });
    result.error = response.error;
    result.bytes_received = response.body_bytes;
    if (result.error.kind == RemoteErrorKind::RangeNotSatisfiable)
    {
        // bytes */1000
        result.total_size = download_total_size(416, response.headers, 0);
        if (auto it = response.headers.find("content-range");
            it == response.headers.end())
        {
            result.total_size.reset();
        }
    }
    if (result.error.ok() && !started)
    {
        result.error = {RemoteErrorKind::Protocol, "empty download response",
                        response.status};
    }
    return result;
}

RemoteError JellyfinClient::report_played(std::string const &item_id,
                                          std::int64_t position_ticks)
{
    auto response = send_authorized(
        [&](std::string const &base, AuthSession const &session)
        {
            json::MutableDocument body;
            auto *root = body.make_root_object();
            auto *doc = body.doc();
            yyjson_mut_obj_add_strncpy(doc, root, "ItemId", item_id.data(),
                                       item_id.size());
            yyjson_mut_obj_add_int(doc, root, "PositionTicks", position_ticks);

            HttpRequest request;
            request.method = "POST";
            request.url = base + "/Sessions/Playing/Stopped";
            request.headers = {"X-Emby-Token: " + session.token,
                               "Content-Type: application/json"};
            request.body = body.write();
            return request;
        });
    return response.error;
}

CertificateProbe JellyfinClient::probe_certificate(std::string const &base_url)
{
    CertificateProbe probe;
    if (auto bad = check_endpoint(base_url))
    {
        probe.error = *bad;
        return probe;
    }
    auto info = http_snapshot().fetch_certificate(base_url +
                                                  "/System/Info/Public");
    if (!info.error.ok())
    {
        probe.error = info.error;
        return probe;
    }
    auto pin = crypto::public_key_pin_from_pem(info.pem);
    if (!pin)
    {
        probe.error = {RemoteErrorKind::Protocol,
                       "could not read the server public key", 0};
        return probe;
    }
    probe.trusted_by_system = info.verified;
    probe.public_key_pin = std::move(*pin);
    return probe;
}

} // namespace kc::remote
