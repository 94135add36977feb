#include "remote/HttpClient.hpp"
#include "remote/JellyfinClient.hpp"

#include <map>
#include <string>

#include <doctest/doctest.h>

namespace
{
using kc::remote::RemoteErrorKind;

kc::remote::JellyfinClient make_client()
{
    kc::remote::JellyfinClient::Identity identity;
    identity.device_id = "device-1";
    return kc::remote::JellyfinClient(identity, kc::remote::HttpClient::Options{});
}

constexpr char kListing[] = R"({
  "Items": [
    {
      "Id": "ep1",
      "Name": "The Big Puddle",
      "RunTimeTicks": 12000000000,
      "DateCreated": "2024-05-01T18:22:10.1234567Z",
      "DateModified": "2024-05-02T00:00:00Z",
      "SeriesName": "Puddle Jumpers",
      "ParentIndexNumber": 1,
      "IndexNumber": 4,
      "UserData": {"PlaybackPositionTicks": 3000000000, "Played": false},
      "ImageTags": {"Primary": "abc123"}
    },
    {
      "Id": "film",
      "Name": "Film",
      "RunTimeTicks": 54000000000,
      "DateCreated": "2024-04-01T00:00:00Z",
      "UserData": {"Played": true}
    },
    {"Name": "No id"},
    "not an object"
  ],
  "TotalRecordCount": 240
})";

} // namespace

TEST_CASE("Item listings are parsed into remote items")
{
    auto page = kc::remote::parse_item_page(kListing, "https://media.example",
                                            "lib-1", 0);
    REQUIRE(page.error.ok());
    CHECK(page.total_count == 240);
    REQUIRE(page.items.size() == 2);

    auto const &episode = page.items[0];
    CHECK(episode.id == "ep1");
    CHECK(episode.title == "The Big Puddle");
    CHECK(episode.duration_ticks == 12'000'000'000);
    CHECK(episode.added_at == 1714587730);
    CHECK(episode.modified_at == 1714608000);
    CHECK(episode.library_id == "lib-1");
    CHECK(episode.series_name == "Puddle Jumpers");
    CHECK(episode.season_index == 1);
    CHECK(episode.episode_index == 4);
    CHECK(episode.resume_position_ticks == std::optional<std::int64_t>(3'000'000'000));
    CHECK(episode.artwork_url ==
          "https://media.example/Items/ep1/Images/Primary?tag=abc123");

    auto const &film = page.items[1];
    CHECK(film.modified_at == film.added_at);
    CHECK_FALSE(film.resume_position_ticks);
    CHECK(film.artwork_url.empty());
    CHECK(film.series_name.empty());
}

TEST_CASE("A listing without a total counts what it received")
{
    auto page = kc::remote::parse_item_page(
        R"({"Items":[{"Id":"a"},{"Id":"b"}]})", "https://media.example", "", 100);
    REQUIRE(page.error.ok());
    CHECK(page.total_count == 102);
}

TEST_CASE("Malformed listings are protocol errors")
{
    for (auto body : {"", "not json", "{}", R"({"Items": {}})", "[]"})
    {
        auto page = kc::remote::parse_item_page(body, "https://media.example",
                                                "lib-1", 0);
        CHECK(page.error.kind == RemoteErrorKind::Protocol);
        CHECK(page.items.empty());
    }
}

TEST_CASE("HTTP statuses map onto remote error kinds")
{
    using kc::remote::classify_http_status;
    CHECK(classify_http_status(200) == RemoteErrorKind::None);
    CHECK(classify_http_status(206) == RemoteErrorKind::None);
    CHECK(classify_http_status(401) == RemoteErrorKind::AuthExpired);
    CHECK(classify_http_status(404) == RemoteErrorKind::NotFound);
    CHECK(classify_http_status(408) == RemoteErrorKind::Transient);
    CHECK(classify_http_status(429) == RemoteErrorKind::Transient);
    CHECK(classify_http_status(503) == RemoteErrorKind::Transient);
    CHECK(classify_http_status(400) == RemoteErrorKind::Protocol);
    CHECK(classify_http_status(416) == RemoteErrorKind::RangeNotSatisfiable);
}

TEST_CASE("Download sizes come from Content-Range before Content-Length")
{
    using kc::remote::download_total_size;
    std::map<std::string, std::string> headers{
        {"content-range", "bytes 100-999/1000"}, {"content-length", "900"}};
    CHECK(download_total_size(206, headers, 100) ==
          std::optional<std::uint64_t>(1000));

    headers.erase("content-range");
    CHECK(download_total_size(206, headers, 100) ==
          std::optional<std::uint64_t>(1000));
    CHECK(download_total_size(200, headers, 100) ==
          std::optional<std::uint64_t>(900));

    headers["content-range"] = "bytes 0-99/*";
    CHECK(download_total_size(200, headers, 0) ==
          std::optional<std::uint64_t>(900));

    CHECK(download_total_size(416, {{"content-range", "bytes */1000"}}, 0) ==
          std::optional<std::uint64_t>(1000));
    CHECK_FALSE(download_total_size(200, {}, 0));
    CHECK_FALSE(download_total_size(200, {{"content-length", "huge"}}, 0));
}

TEST_CASE("Only https servers are contacted")
{
    auto client = make_client();

    auto unset = client.authenticate("kid", "secret");
    CHECK(unset.error.kind == RemoteErrorKind::Protocol);

    client.set_endpoint("http://media.example", "");
    auto plain = client.authenticate("kid", "secret");
    CHECK(plain.error.kind == RemoteErrorKind::Protocol);
    CHECK_FALSE(client.session());

    auto page = client.list_items("lib-1", 0, 100, {});
    CHECK(page.error.kind == RemoteErrorKind::Protocol);
}

TEST_CASE("Authorized calls without a session ask for sign-in")
{
    auto client = make_client();
    client.set_endpoint("https://media.example", "");
    auto page = client.list_items("lib-1", 0, 100, {});
    CHECK(page.error.kind == RemoteErrorKind::AuthExpired);
    CHECK(client.report_played("a", 0).kind == RemoteErrorKind::AuthExpired);
}

TEST_CASE("Stream URLs carry the session token")
{
    auto client = make_client();
    client.set_endpoint("https://media.example/", "");
    CHECK(client.stream_url("a b") ==
          "https://media.example/Videos/a%20b/stream?Static=true");

    client.restore_session({"tok/en", "user-1", "server-1"});
    CHECK(client.stream_url("item") ==
          "https://media.example/Videos/item/stream?Static=true&api_key=tok%2Fen");
}

TEST_CASE("Pointing the client at another server drops the session")
{
    auto client = make_client();
    client.set_endpoint("https://one.example", "");
    client.restore_session({"token", "user-1", "server-1"});
    client.set_endpoint("https://one.example/", "sha256//pin");
    CHECK(client.session());
    client.set_endpoint("https://two.example", "");
    CHECK_FALSE(client.session());
}
