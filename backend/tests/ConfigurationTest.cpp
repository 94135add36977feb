#include "TestSupport.hpp"

#include "engine/ConfigurationService.hpp"
#include "engine/Core.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "utils/StateStore.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <doctest/doctest.h>

namespace
{
using namespace kc::tests;

struct ConfigFixture
{
    explicit ConfigFixture(std::string_view tag)
        : dir(tag), persistence(dir.path() / "state.db"),
          config(&persistence, &bus, defaults_for(dir.path()))
    {
        bus.subscribe<kc::engine::SettingsChangedEvent>(
            [this](kc::engine::SettingsChangedEvent const &) { ++changes; });
    }

    static kc::engine::CoreSettings defaults_for(std::filesystem::path const &root)
    {
        kc::engine::CoreSettings defaults;
        defaults.data_dir = root;
        defaults.state_path = root / "state.db";
        defaults.download_dir = root / "downloads";
        defaults.device_id = "device-1";
        return defaults;
    }

    TempDir dir;
    kc::engine::PersistenceManager persistence;
    kc::engine::EventBus bus;
    kc::engine::ConfigurationService config;
    int changes = 0;
};

} // namespace

TEST_CASE("ConfigurationService persists user settings")
{
    ConfigFixture fx("config-persist");
    auto initial = fx.config.get();
    CHECK(initial.download_dir == fx.dir.path() / "downloads");
    CHECK(initial.server_url.empty());

    fx.config.set_server("https://media.example/");
    fx.config.set_enabled_libraries({"lib-2", "lib-1"});
    fx.config.set_storage_limit(4'000'000'000ull);
    fx.config.persist_if_dirty();

    kc::storage::Database reader(fx.dir.path() / "state.db");
    REQUIRE(reader.is_valid());
    auto server = reader.get_setting("serverUrl");
    REQUIRE(server);
    CHECK(*server == "https://media.example");
    auto device = reader.get_setting("deviceId");
    REQUIRE(device);
    CHECK(*device == "device-1");
    auto limit = reader.get_setting("storageLimitBytes");
    REQUIRE(limit);
    CHECK(*limit == "4000000000");
    auto libraries = reader.get_setting("enabledLibraries");
    REQUIRE(libraries);
    CHECK(kc::storage::deserialize_string_list(*libraries) ==
          std::vector<std::string>{"lib-1", "lib-2"});

    auto restored = fx.persistence.load_settings(
        ConfigFixture::defaults_for(fx.dir.path()));
    CHECK(restored.server_url == "https://media.example");
    CHECK(restored.storage_limit_bytes == 4'000'000'000ull);
}

TEST_CASE("Nothing is written while the settings are clean")
{
    ConfigFixture fx("config-clean");
    fx.config.persist_if_dirty();
    kc::storage::Database reader(fx.dir.path() / "state.db");
    CHECK_FALSE(reader.get_setting("serverUrl"));
}

TEST_CASE("A new server drops the pinned key")
{
    ConfigFixture fx("config-server");
    fx.config.set_server("https://one.example");
    fx.config.set_pinned_public_key("sha256//one");
    CHECK(fx.config.get().pinned_public_key == "sha256//one");

    fx.config.set_server("https://one.example//");
    CHECK(fx.config.get().pinned_public_key == "sha256//one");

    fx.config.set_server("https://two.example");
    CHECK(fx.config.get().server_url == "https://two.example");
    CHECK(fx.config.get().pinned_public_key.empty());
}

TEST_CASE("The storage ceiling never drops below the reserved floor")
{
    ConfigFixture fx("config-storage");
    auto const floor = fx.config.get().storage_floor_bytes;
    fx.config.set_storage_limit(10);
    CHECK(fx.config.get().storage_limit_bytes == floor);
}

TEST_CASE("The autoplay countdown is clamped to three to ten seconds")
{
    ConfigFixture fx("config-autoplay");
    fx.config.set_autoplay(std::nullopt, 1);
    CHECK(fx.config.get().autoplay_countdown_seconds == 3);
    fx.config.set_autoplay(std::nullopt, 60);
    CHECK(fx.config.get().autoplay_countdown_seconds == 10);
    fx.config.set_autoplay(false, std::nullopt);
    CHECK_FALSE(fx.config.get().autoplay_enabled);
    CHECK(fx.config.get().autoplay_countdown_seconds == 10);
}

TEST_CASE("Library selections are normalised")
{
    ConfigFixture fx("config-libraries");
    fx.config.set_enabled_libraries({"b", "", "a", "b"});
    CHECK(fx.config.get().enabled_libraries == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Change notifications fire only on real changes")
{
    ConfigFixture fx("config-events");
    fx.config.set_server("https://media.example");
    fx.config.set_server("https://media.example/");
    CHECK(fx.changes == 1);

    fx.config.set_enabled_libraries({"a"});
    fx.config.set_enabled_libraries({"a", "a"});
    CHECK(fx.changes == 2);

    fx.config.set_autoplay(true, 5);
    CHECK(fx.changes == 2);
    fx.config.set_autoplay(true, 7);
    CHECK(fx.changes == 3);

    auto const limit = fx.config.get().storage_limit_bytes;
    fx.config.set_storage_limit(limit);
    CHECK(fx.changes == 3);
}
