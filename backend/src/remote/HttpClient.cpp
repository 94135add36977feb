#include "remote/HttpClient.hpp"

#include "utils/Log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <string_view>

namespace kc::remote
{

namespace
{

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensure_global_init()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHandle make_handle()
{
    ensure_global_init();
    return CurlHandle(curl_easy_init(), &curl_easy_cleanup);
}

struct TransferState
{
    HttpRequest const *request = nullptr;
    HttpResponse *response = nullptr;
    CURL *handle = nullptr;
    bool started = false;
    bool sink_body = false;
    bool sink_refused = false;
};

std::string trim(std::string_view value)
{
    auto const first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
    {
        return {};
    }
    auto const last = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(first, last - first + 1));
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata)
{
    auto *state = static_cast<TransferState *>(userdata);
    auto const total = size * nitems;
    std::string_view line(buffer, total);
    // A new status line (redirect, 100-continue) starts a fresh header set.
    if (line.starts_with("HTTP/"))
    {
        state->response->headers.clear();
        return total;
    }
    auto const colon = line.find(':');
    if (colon == std::string_view::npos)
    {
        return total;
    }
    std::string name(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    state->response->headers[std::move(name)] = trim(line.substr(colon + 1));
    return total;
}

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *state = static_cast<TransferState *>(userdata);
    auto const total = size * nmemb;
    if (!state->started)
    {
        state->started = true;
        long status = 0;
        curl_easy_getinfo(state->handle, CURLINFO_RESPONSE_CODE, &status);
        state->response->status = status;
        bool const success = status >= 200 && status < 300;
        state->sink_body = success && static_cast<bool>(state->request->on_body);
        if (success && state->request->on_response)
        {
            state->request->on_response(status, state->response->headers);
        }
    }
    if (state->request->cancel.is_cancelled())
    {
        return 0;
    }
    if (state->sink_body)
    {
        if (!state->request->on_body(std::span<char const>(ptr, total)))
        {
            state->sink_refused = true;
            return 0;
        }
    }
    else
    {
        state->response->body.append(ptr, total);
    }
    state->response->body_bytes += total;
    return total;
}

int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t)
{
    auto *state = static_cast<TransferState *>(clientp);
    return state->request->cancel.is_cancelled() ? 1 : 0;
}

RemoteError map_curl_error(CURLcode code, TransferState const &state,
                           char const *detail)
{
    RemoteError error;
    error.message = detail[0] != '\0' ? detail : curl_easy_strerror(code);
    switch (code)
    {
    case CURLE_ABORTED_BY_CALLBACK:
        error.kind = RemoteErrorKind::Cancelled;
        break;
    case CURLE_WRITE_ERROR:
        error.kind = state.sink_refused || state.request->cancel.is_cancelled()
                         ? RemoteErrorKind::Cancelled
                         : RemoteErrorKind::Transient;
        break;
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        error.kind = RemoteErrorKind::Untrusted;
        break;
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
        error.kind = RemoteErrorKind::Protocol;
        break;
    default:
        // Timeouts, refused connections, resets and resolver failures.
        error.kind = RemoteErrorKind::Transient;
        break;
    }
    return error;
}

void apply_common_options(CURL *curl, HttpClient::Options const &options)
{
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "https");
}

} // namespace

RemoteErrorKind classify_http_status(long status) noexcept
{
    if (status >= 200 && status < 300)
    {
        return RemoteErrorKind::None;
    }
    if (status == 401)
    {
        return RemoteErrorKind::AuthExpired;
    }
    if (status == 404)
    {
        return RemoteErrorKind::NotFound;
    }
    if (status == 416)
    {
        return RemoteErrorKind::RangeNotSatisfiable;
    }
    if (status == 408 || status == 429 || status >= 500)
    {
        return RemoteErrorKind::Transient;
    }
    return RemoteErrorKind::Protocol;
}

HttpClient::HttpClient(Options options) : options_(std::move(options))
{
}

void HttpClient::set_pinned_public_key(std::string pin)
{
    pinned_key_ = std::move(pin);
}

HttpResponse HttpClient::perform(HttpRequest const &request) const
{
    HttpResponse response;
    auto curl = make_handle();
    if (!curl)
    {
        response.error = {RemoteErrorKind::Transient, "curl_easy_init failed",
                          0};
        return response;
    }

    TransferState state;
    state.request = &request;
    state.response = &response;
    state.handle = curl.get();

    CurlHeaders headers(nullptr, &curl_slist_free_all);
    for (auto const &header : request.headers)
    {
        auto *appended = curl_slist_append(headers.get(), header.c_str());
        if (appended == nullptr)
        {
            response.error = {RemoteErrorKind::Transient,
                              "out of memory building headers", 0};
            return response;
        }
        headers.release();
        headers.reset(appended);
    }

    char error_buffer[CURL_ERROR_SIZE] = {};
    std::string range;

    CURL *h = curl.get();
    apply_common_options(h, options_);
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);

    if (request.method == "POST")
    {
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.body.size()));
    }
    else if (request.method != "GET")
    {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (request.range_start && *request.range_start > 0)
    {
        range = std::to_string(*request.range_start) + "-";
        curl_easy_setopt(h, CURLOPT_RANGE, range.c_str());
    }

    if (request.streaming)
    {
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1024L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(options_.timeout.count()));
    }
    else
    {
        curl_easy_setopt(h, CURLOPT_TIMEOUT,
                         static_cast<long>(options_.timeout.count()));
    }

    if (!pinned_key_.empty())
    {
        // The pin replaces the CA chain; the key itself is still checked.
        curl_easy_setopt(h, CURLOPT_PINNEDPUBLICKEY, pinned_key_.c_str());
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    else
    {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    }

    auto const code = curl_easy_perform(h);
    if (code != CURLE_OK)
    {
        response.error = map_curl_error(code, state, error_buffer);
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
        response.error.http_status = response.status;
        return response;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    if (!state.started && response.status >= 200 && response.status < 300 &&
        request.on_response)
    {
        // Empty body: the write callback never ran.
        request.on_response(response.status, response.headers);
    }
    auto const kind = classify_http_status(response.status);
    if (kind != RemoteErrorKind::None)
    {
        response.error.kind = kind;
        response.error.http_status = response.status;
        response.error.message = "HTTP " + std::to_string(response.status);
    }
    return response;
}

CertificateInfo HttpClient::fetch_certificate(std::string const &url) const
{
    CertificateInfo info;
    for (bool verify : {true, false})
    {
        auto curl = make_handle();
        if (!curl)
        {
            info.error = {RemoteErrorKind::Transient, "curl_easy_init failed",
                          0};
            return info;
        }
        CURL *h = curl.get();
        char error_buffer[CURL_ERROR_SIZE] = {};
        apply_common_options(h, options_);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_CERTINFO, 1L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT,
                         static_cast<long>(options_.timeout.count()));
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);

        auto const code = curl_easy_perform(h);
        if (code == CURLE_PEER_FAILED_VERIFICATION && verify)
        {
            KC_LOG_INFO("remote: certificate not trusted by the system, "
                        "fetching it for confirmation");
            continue;
        }
        if (code != CURLE_OK)
        {
            TransferState state;
            HttpRequest none;
            state.request = &none;
            info.error = map_curl_error(code, state, error_buffer);
            return info;
        }

        curl_certinfo *certs = nullptr;
        if (curl_easy_getinfo(h, CURLINFO_CERTINFO, &certs) != CURLE_OK ||
            certs == nullptr || certs->num_of_certs < 1)
        {
            info.error = {RemoteErrorKind::Protocol,
                          "server presented no certificate", 0};
            return info;
        }
        // Entry 0 is the leaf.
        for (auto *field = certs->certinfo[0]; field != nullptr;
             field = field->next)
        {
            std::string_view data(field->data);
            if (data.starts_with("Cert:"))
            {
                info.pem = std::string(data.substr(5));
                break;
            }
        }
        if (info.pem.empty())
        {
            info.error = {RemoteErrorKind::Protocol,
                          "certificate body unavailable", 0};
            return info;
        }
        info.verified = verify;
        return info;
    }
    info.error = {RemoteErrorKind::Untrusted, "certificate fetch failed", 0};
    return info;
}

} // namespace kc::remote
