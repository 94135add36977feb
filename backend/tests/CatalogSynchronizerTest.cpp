#include "TestSupport.hpp"

#include "engine/AsyncTaskService.hpp"
#include "engine/CatalogSynchronizer.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <doctest/doctest.h>

namespace
{
using namespace kc::tests;
using kc::engine::NetworkState;
using kc::engine::SyncStatus;

struct SyncFixture
{
    explicit SyncFixture(std::string_view tag)
        : dir(tag), clock(std::make_shared<ManualClock>()),
          persistence(dir.path() / "state.db"),
          server(std::make_shared<FakeMediaServer>()),
          synchronizer(&persistence, server, clock, &bus,
                       [this] { return network; })
    {
        persistence.set_active_user("user-1");
        server->restore_session(server->issued);
        bus.subscribe<kc::engine::CatalogSyncedEvent>(
            [this](kc::engine::CatalogSyncedEvent const &event)
            { events.push_back(event.result); });
    }

    std::vector<std::string> catalog_ids()
    {
        std::vector<std::string> ids;
        for (auto const &entry : persistence.catalog())
        {
            ids.push_back(entry.item_id);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    TempDir dir;
    std::shared_ptr<ManualClock> clock;
    kc::engine::PersistenceManager persistence;
    kc::engine::EventBus bus;
    std::shared_ptr<FakeMediaServer> server;
    NetworkState network = NetworkState::Unmetered;
    kc::engine::CatalogSynchronizer synchronizer;
    std::vector<kc::engine::SyncResult> events;
};

using Ids = std::vector<std::string>;

} // namespace

TEST_CASE("Sync without connectivity reports offline and touches nothing")
{
    SyncFixture fx("sync-offline");
    fx.network = NetworkState::None;
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};

    auto result = fx.synchronizer.sync({"lib-1"});
    CHECK(result.status == SyncStatus::Offline);
    CHECK(fx.server->list_calls == 0);
    CHECK(fx.persistence.catalog().empty());
    CHECK_FALSE(fx.synchronizer.last_sync_at());
}

TEST_CASE("Sync without a session asks for sign-in")
{
    SyncFixture fx("sync-signed-out");
    fx.server->sign_out();
    auto result = fx.synchronizer.sync({});
    CHECK(result.status == SyncStatus::AuthRequired);
}

TEST_CASE("Sync on a metered link still runs")
{
    SyncFixture fx("sync-metered");
    fx.network = NetworkState::Metered;
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    CHECK(fx.synchronizer.sync({"lib-1"}).status == SyncStatus::Completed);
}

TEST_CASE("Sync adds new items and updates changed ones")
{
    SyncFixture fx("sync-delta");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100),
                                     make_item("b", "lib-1", 200)};

    auto first = fx.synchronizer.sync({"lib-1"});
    CHECK(first.status == SyncStatus::Completed);
    CHECK(first.added == Ids{"a", "b"});
    CHECK(first.updated.empty());
    CHECK(fx.catalog_ids() == Ids{"a", "b"});
    REQUIRE(fx.events.size() == 1);
    CHECK(fx.events.front().added == Ids{"a", "b"});

    auto &b = fx.server->libraries["lib-1"][1];
    b.title = "Renamed";
    b.modified_at = 900;
    auto second = fx.synchronizer.sync({"lib-1"});
    CHECK(second.added.empty());
    CHECK(second.updated == Ids{"b"});
    CHECK(fx.persistence.entry("b")->title == "Renamed");
    CHECK(fx.persistence.entry("b")->remote_modified_at == 900);

    auto third = fx.synchronizer.sync({"lib-1"});
    CHECK(third.empty_delta());
}

TEST_CASE("Metadata updates keep local download and playback state")
{
    SyncFixture fx("sync-local-fields");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    REQUIRE(fx.synchronizer.sync({"lib-1"}).status == SyncStatus::Completed);

    fx.persistence.update_download_fields("a", "/media/a.mp4", 1.0, 42, "abc",
                                          5);
    fx.persistence.update_playback_fields("a", true, 77, 0);

    fx.server->libraries["lib-1"][0].modified_at = 500;
    auto result = fx.synchronizer.sync({"lib-1"});
    CHECK(result.updated == Ids{"a"});

    auto entry = fx.persistence.entry("a");
    REQUIRE(entry);
    CHECK(entry->local_file_path == std::optional<std::string>("/media/a.mp4"));
    CHECK(entry->file_size == 42);
    CHECK(entry->watched);
    CHECK(entry->last_watched_at == std::optional<std::int64_t>(77));
}

TEST_CASE("Items disappear only after two consecutive missing passes")
{
    SyncFixture fx("sync-removal");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100),
                                     make_item("b", "lib-1", 200)};
    REQUIRE(fx.synchronizer.sync({"lib-1"}).status == SyncStatus::Completed);
    fx.persistence.update_download_fields("a", "/media/a.mp4", 1.0, 10, {}, 1);

    fx.server->libraries["lib-1"] = {make_item("b", "lib-1", 200)};
    auto first = fx.synchronizer.sync({"lib-1"});
    CHECK(first.removed.empty());
    CHECK(fx.persistence.entry("a")->missing_passes == 1);

    auto second = fx.synchronizer.sync({"lib-1"});
    CHECK(second.removed == Ids{"a"});
    REQUIRE(second.removed_files.size() == 1);
    CHECK(second.removed_files.front() == std::filesystem::path("/media/a.mp4"));
    CHECK(fx.catalog_ids() == Ids{"b"});
}

TEST_CASE("An item that comes back resets its missing count")
{
    SyncFixture fx("sync-flap");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    REQUIRE(fx.synchronizer.sync({"lib-1"}).status == SyncStatus::Completed);

    fx.server->libraries["lib-1"].clear();
    fx.synchronizer.sync({"lib-1"});
    CHECK(fx.persistence.entry("a")->missing_passes == 1);

    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    fx.synchronizer.sync({"lib-1"});
    CHECK(fx.persistence.entry("a")->missing_passes == 0);

    fx.server->libraries["lib-1"].clear();
    CHECK(fx.synchronizer.sync({"lib-1"}).removed.empty());
}

TEST_CASE("A failing library is skipped without removing its items")
{
    SyncFixture fx("sync-partial");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    fx.server->libraries["lib-2"] = {make_item("b", "lib-2", 200)};
    REQUIRE(fx.synchronizer.sync({"lib-1", "lib-2"}).status ==
            SyncStatus::Completed);

    fx.server->failing_libraries = {"lib-2"};
    for (int pass = 0; pass < 3; ++pass)
    {
        auto result = fx.synchronizer.sync({"lib-1", "lib-2"});
        CHECK(result.status == SyncStatus::Completed);
        CHECK_FALSE(result.message.empty());
        CHECK(result.removed.empty());
    }
    CHECK(fx.persistence.entry("b")->missing_passes == 0);
}

TEST_CASE("Sync fails when no library can be listed")
{
    SyncFixture fx("sync-all-failed");
    fx.server->failing_libraries = {"lib-1"};
    auto result = fx.synchronizer.sync({"lib-1"});
    CHECK(result.status == SyncStatus::Failed);
    CHECK_FALSE(fx.synchronizer.last_sync_at());
}

TEST_CASE("Entries of a library no longer selected are retired")
{
    SyncFixture fx("sync-disabled-library");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    fx.server->libraries["lib-2"] = {make_item("b", "lib-2", 200)};
    REQUIRE(fx.synchronizer.sync({"lib-1", "lib-2"}).status ==
            SyncStatus::Completed);

    fx.synchronizer.sync({"lib-1"});
    auto result = fx.synchronizer.sync({"lib-1"});
    CHECK(result.removed == Ids{"b"});
    CHECK(fx.catalog_ids() == Ids{"a"});
}

TEST_CASE("An empty selection mirrors every library of the user")
{
    SyncFixture fx("sync-all-libraries");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    fx.server->libraries["lib-2"] = {make_item("b", "lib-2", 200)};

    auto result = fx.synchronizer.sync({});
    CHECK(result.added == Ids{"a", "b"});
    CHECK(fx.persistence.entry("b")->library_id == "lib-2");
}

TEST_CASE("Listings are paged")
{
    SyncFixture fx("sync-paging");
    auto &items = fx.server->libraries["lib-1"];
    for (int i = 0; i < 250; ++i)
    {
        items.push_back(make_item("item-" + std::to_string(i), "lib-1", i));
    }

    auto result = fx.synchronizer.sync({"lib-1"});
    CHECK(result.added.size() == 250);
    CHECK(fx.server->list_calls == 3);
}

TEST_CASE("Server resume positions are applied when playback has started")
{
    SyncFixture fx("sync-resume");
    auto started = make_item("a", "lib-1", 100);
    started.resume_position_ticks = 30 * kc::engine::kTicksPerSecond;
    auto fresh = make_item("b", "lib-1", 200);
    fresh.resume_position_ticks = 0;
    fx.server->libraries["lib-1"] = {started, fresh};
    REQUIRE(fx.synchronizer.sync({"lib-1"}).status == SyncStatus::Completed);
    CHECK(fx.persistence.entry("a")->resume_position_ms == 30'000);

    fx.persistence.update_resume_position("b", 12'000);
    fx.synchronizer.sync({"lib-1"});
    CHECK(fx.persistence.entry("b")->resume_position_ms == 12'000);
}

TEST_CASE("An expired token during listing asks for sign-in")
{
    SyncFixture fx("sync-auth-expired");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    fx.server->list_error = kc::remote::RemoteErrorKind::AuthExpired;
    auto result = fx.synchronizer.sync({"lib-1"});
    CHECK(result.status == SyncStatus::AuthRequired);
    CHECK(fx.persistence.catalog().empty());
}

TEST_CASE("A cancelled pass applies nothing")
{
    SyncFixture fx("sync-cancel");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    fx.server->on_list = [&fx] { fx.synchronizer.cancel(); };

    auto result = fx.synchronizer.sync({"lib-1"});
    CHECK(result.status == SyncStatus::Cancelled);
    CHECK(fx.persistence.catalog().empty());
    CHECK_FALSE(fx.synchronizer.in_progress());
    CHECK(fx.synchronizer.last_result()->status == SyncStatus::Cancelled);
}

TEST_CASE("Scheduled passes become due after the interval")
{
    SyncFixture fx("sync-due");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    CHECK(fx.synchronizer.is_due(std::chrono::hours(24)));

    REQUIRE(fx.synchronizer.sync({"lib-1"}).status == SyncStatus::Completed);
    REQUIRE(fx.synchronizer.last_sync_at());
    CHECK(*fx.synchronizer.last_sync_at() ==
          kc::utils::to_unix_seconds(fx.clock->now()));
    CHECK_FALSE(fx.synchronizer.is_due(std::chrono::hours(24)));

    fx.clock->advance(std::chrono::hours(25));
    CHECK(fx.synchronizer.is_due(std::chrono::hours(24)));
}

TEST_CASE("The last sync time survives a restart")
{
    TempDir dir("sync-restart");
    auto clock = std::make_shared<ManualClock>();
    auto server = std::make_shared<FakeMediaServer>();
    server->restore_session(server->issued);
    server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};
    kc::engine::EventBus bus;
    auto online = [] { return NetworkState::Unmetered; };
    {
        kc::engine::PersistenceManager persistence(dir.path() / "state.db");
        persistence.set_active_user("user-1");
        kc::engine::CatalogSynchronizer synchronizer(&persistence, server,
                                                     clock, &bus, online);
        REQUIRE(synchronizer.sync({"lib-1"}).status == SyncStatus::Completed);
    }
    kc::engine::PersistenceManager persistence(dir.path() / "state.db");
    persistence.set_active_user("user-1");
    kc::engine::CatalogSynchronizer synchronizer(&persistence, server, clock,
                                                 &bus, online);
    CHECK(synchronizer.last_sync_at());
    CHECK_FALSE(synchronizer.is_due(std::chrono::hours(24)));
    CHECK(persistence.catalog().size() == 1);
}

TEST_CASE("Callers arriving during a pass share its result")
{
    SyncFixture fx("sync-join");
    fx.server->libraries["lib-1"] = {make_item("a", "lib-1", 100)};

    kc::engine::AsyncTaskService worker("sync-test");
    worker.start();
    std::shared_future<kc::engine::SyncResult> joined;
    fx.server->on_list = [&]
    {
        if (!joined.valid())
        {
            joined = fx.synchronizer.begin({"lib-1"}, &worker);
        }
    };
    auto first = fx.synchronizer.begin({"lib-1"}, &worker);
    auto result = first.get();
    worker.stop();

    REQUIRE(joined.valid());
    CHECK(joined.get().added == result.added);
    CHECK(fx.server->list_calls == 1);
}
