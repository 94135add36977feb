#pragma once

#include "engine/Core.hpp"
#include "engine/MediaPlayer.hpp"
#include "engine/NetworkMonitor.hpp"
#include "engine/ParentalGate.hpp"
#include "engine/PowerMonitor.hpp"
#include "remote/MediaServerClient.hpp"
#include "utils/Clock.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace kc::tests
{

// Polls `done` until it holds or `timeout` passes.
template <typename Predicate>
bool wait_for(Predicate done,
              std::chrono::milliseconds timeout = std::chrono::seconds(5))
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!done())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

// Scratch directory under the system temp dir, wiped on both ends.
class TempDir
{
  public:
    explicit TempDir(std::string_view tag)
        : path_(std::filesystem::temp_directory_path() / "kctest" /
                std::string(tag))
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_, ec);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(TempDir const &) = delete;
    TempDir &operator=(TempDir const &) = delete;

    std::filesystem::path const &path() const noexcept
    {
        return path_;
    }

  private:
    std::filesystem::path path_;
};

inline void write_file(std::filesystem::path const &path,
                       std::string_view contents)
{
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string read_file(std::filesystem::path const &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

// Wall clock, steady clock and calendar day all move only when told to.
class ManualClock final : public utils::Clock
{
  public:
    ManualClock()
        : wall_(utils::from_unix_millis(1'700'000'000'000)),
          steady_(SteadyTime(std::chrono::hours(1000)))
    {
    }

    WallTime now() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return wall_;
    }

    SteadyTime steady_now() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return steady_;
    }

    std::string local_date() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return date_;
    }

    void advance(std::chrono::milliseconds delta)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wall_ += delta;
        steady_ += delta;
    }

    void set_date(std::string date)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        date_ = std::move(date);
    }

    LocalTime local_time() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return local_;
    }

    void set_local_time(int weekday, int hour, int minute = 0)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        local_ = LocalTime{weekday, hour * 60 + minute};
    }

    std::int64_t now_ms() const
    {
        return utils::to_unix_millis(now());
    }

  private:
    mutable std::mutex mutex_;
    WallTime wall_;
    SteadyTime steady_;
    std::string date_{"2024-05-01"};
    // Wall and local time move independently; 2024-05-01 is a Wednesday.
    LocalTime local_{2, 12 * 60};
};

struct ConnectivityScript
{
    std::mutex mutex;
    std::optional<engine::NetworkState> state = engine::NetworkState::Unmetered;

    void set(std::optional<engine::NetworkState> next)
    {
        std::lock_guard<std::mutex> lock(mutex);
        state = next;
    }
};

class ScriptedConnectivityProbe final : public engine::ConnectivityProbe
{
  public:
    explicit ScriptedConnectivityProbe(std::shared_ptr<ConnectivityScript> script)
        : script_(std::move(script))
    {
    }

    std::optional<engine::NetworkState> probe() override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        return script_->state;
    }

  private:
    std::shared_ptr<ConnectivityScript> script_;
};

struct PowerScript
{
    std::mutex mutex;
    std::optional<engine::PowerStatus> status =
        engine::PowerStatus{true, 100, true};

    void set(std::optional<engine::PowerStatus> next)
    {
        std::lock_guard<std::mutex> lock(mutex);
        status = next;
    }
};

class ScriptedPowerProbe final : public engine::PowerProbe
{
  public:
    explicit ScriptedPowerProbe(std::shared_ptr<PowerScript> script)
        : script_(std::move(script))
    {
    }

    std::optional<engine::PowerStatus> probe() override
    {
        std::lock_guard<std::mutex> lock(script_->mutex);
        return script_->status;
    }

  private:
    std::shared_ptr<PowerScript> script_;
};

class FixedPinVerifier final : public engine::PinVerifier
{
  public:
    explicit FixedPinVerifier(std::string pin) : pin_(std::move(pin))
    {
    }

    bool verify_pin(std::string const &candidate) override
    {
        return candidate == pin_;
    }

  private:
    std::string pin_;
};

// Records every command the playback manager issues.
class RecordingPlayer final : public engine::MediaPlayer
{
  public:
    struct Command
    {
        std::string name;
        engine::PlaybackSource source;
        std::int64_t position_ms = 0;
    };

    // Runs before a command is recorded, outside the player's lock. Set it
    // before the manager is driven from other threads.
    std::function<void(std::string_view)> before_command;

    void open(engine::PlaybackSource const &source,
              std::int64_t start_ms) override
    {
        record({"open", source, start_ms});
    }
    void switch_source(engine::PlaybackSource const &source,
                       std::int64_t position_ms) override
    {
        record({"switch", source, position_ms});
    }
    void seek(std::int64_t position_ms) override
    {
        record({"seek", {}, position_ms});
    }
    void play() override
    {
        record({"play", {}, 0});
    }
    void pause() override
    {
        record({"pause", {}, 0});
    }
    void stop() override
    {
        record({"stop", {}, 0});
    }

    std::vector<Command> commands() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    std::optional<Command> last(std::string_view name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = commands_.rbegin(); it != commands_.rend(); ++it)
        {
            if (it->name == name)
            {
                return *it;
            }
        }
        return std::nullopt;
    }

    std::size_t count(std::string_view name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(
            std::count_if(commands_.begin(), commands_.end(),
                          [name](Command const &c) { return c.name == name; }));
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.clear();
    }

  private:
    void record(Command command)
    {
        if (before_command)
        {
            before_command(command.name);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(std::move(command));
    }

    mutable std::mutex mutex_;
    std::vector<Command> commands_;
};

// In-process media server. Listings, files and failures are scripted by the
// test; every request is recorded.
class FakeMediaServer final : public remote::MediaServerClient
{
  public:
    // Library id -> items. The empty id lists every library.
    std::map<std::string, std::vector<remote::RemoteItem>> libraries;
    std::set<std::string> failing_libraries;
    remote::RemoteErrorKind list_error = remote::RemoteErrorKind::None;
    std::function<void()> on_list;

    std::string username = "kid";
    std::string password = "secret";
    remote::AuthSession issued{"token-1", "user-1", "server-1"};
    remote::RemoteErrorKind auth_error = remote::RemoteErrorKind::None;

    remote::CertificateProbe certificate{{}, true, "sha256//trusted"};

    // Item id -> file contents.
    std::map<std::string, std::string> files;
    bool honour_range = true;
    std::optional<std::uint64_t> fail_after_bytes;
    remote::RemoteErrorKind download_error = remote::RemoteErrorKind::None;
    std::optional<std::string> sha256;
    std::size_t chunk_size = 4;
    // Runs after the first chunk was delivered.
    std::function<void()> during_download;

    std::atomic<int> list_calls{0};

    void set_endpoint(std::string base_url,
                      std::string pinned_public_key) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        base_url_ = std::move(base_url);
        pin_ = std::move(pinned_public_key);
    }

    remote::AuthResult authenticate(std::string const &user,
                                    std::string const &pass) override
    {
        remote::AuthResult result;
        if (auth_error != remote::RemoteErrorKind::None)
        {
            result.error = {auth_error, "scripted auth failure", 0};
            return result;
        }
        if (user != username || pass != password)
        {
            result.error = {remote::RemoteErrorKind::AuthExpired,
                            "invalid username or password", 401};
            return result;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = issued;
        result.session = issued;
        return result;
    }

    std::optional<remote::AuthSession> session() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_;
    }

    void restore_session(remote::AuthSession restored) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = std::move(restored);
    }

    void sign_out()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.reset();
    }

    remote::ItemPage list_items(std::string const &library_id, int start_index,
                                int limit,
                                utils::CancellationToken const &cancel) override
    {
        ++list_calls;
        if (on_list)
        {
            on_list();
        }
        remote::ItemPage page;
        if (cancel.is_cancelled())
        {
            page.error = {remote::RemoteErrorKind::Cancelled, "cancelled", 0};
            return page;
        }
        if (list_error != remote::RemoteErrorKind::None)
        {
            page.error = {list_error, "scripted listing failure", 0};
            return page;
        }
        if (failing_libraries.contains(library_id))
        {
            page.error = {remote::RemoteErrorKind::Transient, "library down",
                          503};
            return page;
        }
        std::vector<remote::RemoteItem> all;
        if (library_id.empty())
        {
            for (auto const &[id, items] : libraries)
            {
                all.insert(all.end(), items.begin(), items.end());
            }
        }
        else if (auto it = libraries.find(library_id); it != libraries.end())
        {
            all = it->second;
        }
        page.total_count = static_cast<std::int64_t>(all.size());
        for (int i = start_index;
             i < start_index + limit && i < static_cast<int>(all.size()); ++i)
        {
            page.items.push_back(all[static_cast<std::size_t>(i)]);
        }
        return page;
    }

    std::string stream_url(std::string const &item_id) const override
    {
        return "https://media.test/stream/" + item_id;
    }

    remote::DownloadResult download(remote::DownloadRequest const &request) override
    {
        remote::DownloadResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            offsets_.push_back(request.offset);
        }
        if (download_error != remote::RemoteErrorKind::None)
        {
            result.error = {download_error, "scripted download failure", 0};
            return result;
        }
        auto it = files.find(request.item_id);
        if (it == files.end())
        {
            result.error = {remote::RemoteErrorKind::NotFound, "no such item",
                            404};
            return result;
        }
        auto const &body = it->second;
        if (request.offset > 0 && honour_range && request.offset >= body.size())
        {
            result.error = {remote::RemoteErrorKind::RangeNotSatisfiable,
                            "range not satisfiable", 416};
            result.total_size = body.size();
            return result;
        }
        bool const ranged = request.offset > 0 && honour_range;
        std::uint64_t const begin = ranged ? request.offset : 0;
        result.range_honoured = request.offset == 0 || ranged;
        result.total_size = body.size();
        result.sha256 = sha256;
        if (request.on_start)
        {
            request.on_start(
                remote::DownloadStart{result.range_honoured, result.total_size});
        }

        std::uint64_t sent = 0;
        bool hook_fired = false;
        for (std::uint64_t pos = begin; pos < body.size(); pos += chunk_size)
        {
            if (request.cancel.is_cancelled())
            {
                result.error = {remote::RemoteErrorKind::Cancelled, "cancelled",
                                0};
                return result;
            }
            if (fail_after_bytes && sent >= *fail_after_bytes)
            {
                result.error = {remote::RemoteErrorKind::Transient,
                                "connection reset", 0};
                return result;
            }
            auto const len = std::min<std::uint64_t>(chunk_size,
                                                     body.size() - pos);
            std::span<char const> chunk(body.data() + pos,
                                        static_cast<std::size_t>(len));
            sent += len;
            result.bytes_received += len;
            if (request.on_data && !request.on_data(chunk))
            {
                result.error = {remote::RemoteErrorKind::Cancelled, "cancelled",
                                0};
                return result;
            }
            if (!hook_fired && during_download)
            {
                hook_fired = true;
                during_download();
            }
        }
        return result;
    }

    remote::RemoteError report_played(std::string const &item_id,
                                      std::int64_t position_ticks) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reports_.emplace_back(item_id, position_ticks);
        return {};
    }

    remote::CertificateProbe probe_certificate(std::string const &) override
    {
        return certificate;
    }

    std::vector<std::uint64_t> offsets() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return offsets_;
    }

    std::vector<std::pair<std::string, std::int64_t>> reports() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return reports_;
    }

    std::string pinned_key() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pin_;
    }

  private:
    mutable std::mutex mutex_;
    std::string base_url_;
    std::string pin_;
    std::optional<remote::AuthSession> session_;
    std::vector<std::uint64_t> offsets_;
    std::vector<std::pair<std::string, std::int64_t>> reports_;
};

inline std::int64_t minutes_to_ticks(int minutes)
{
    return static_cast<std::int64_t>(minutes) * 60 * engine::kTicksPerSecond;
}

inline engine::CatalogEntry make_entry(std::string id, int minutes,
                                       std::int64_t added_at,
                                       std::string library = "lib-1")
{
    engine::CatalogEntry entry;
    entry.item_id = id;
    entry.title = "Title " + id;
    entry.duration_ticks = minutes_to_ticks(minutes);
    entry.library_id = std::move(library);
    entry.added_at = added_at;
    entry.remote_modified_at = added_at;
    return entry;
}

inline remote::RemoteItem make_item(std::string id, std::string library,
                                    std::int64_t added_at, int minutes = 20)
{
    remote::RemoteItem item;
    item.id = id;
    item.title = "Title " + id;
    item.duration_ticks = minutes_to_ticks(minutes);
    item.added_at = added_at;
    item.modified_at = added_at;
    item.library_id = std::move(library);
    return item;
}

} // namespace kc::tests
