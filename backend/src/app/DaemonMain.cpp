#include "app/DaemonMain.hpp"

#include "engine/Core.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace
{

struct DaemonOptions
{
    std::string data_dir;
    std::string server;
    std::string user;
    std::string password;
    std::vector<std::string> libraries;
    bool sync_now = false;
    bool help = false;
};

constexpr char const kUsage[] =
    "Usage: kidcached [options]\n"
    "  --data-dir <dir>    state and downloads root (KC_DATA_DIR)\n"
    "  --server <url>      https:// address of the media server "
    "(KC_SERVER_URL)\n"
    "  --user <name>       account to sign in with (KC_USERNAME)\n"
    "  --password <pw>     password for --user (KC_PASSWORD)\n"
    "  --library <id>      library to mirror, repeatable (KC_LIBRARIES, "
    "comma separated)\n"
    "  --sync-now          run a catalog sync right after start\n"
    "  --help              show this text\n";

std::optional<std::string> read_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

std::string trim_whitespace(std::string value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> split_list(std::string const &raw)
{
    std::vector<std::string> result;
    std::string buffer;
    for (char ch : raw)
    {
        if (ch == ',' || ch == ';')
        {
            if (auto trimmed = trim_whitespace(buffer); !trimmed.empty())
            {
                result.push_back(std::move(trimmed));
            }
            buffer.clear();
            continue;
        }
        buffer.push_back(ch);
    }
    if (auto trimmed = trim_whitespace(buffer); !trimmed.empty())
    {
        result.push_back(std::move(trimmed));
    }
    return result;
}

// Returns nullopt and prints the reason on a malformed command line.
std::optional<DaemonOptions> parse_options(int argc, char *argv[])
{
    DaemonOptions options;
    for (int index = 1; index < argc; ++index)
    {
        std::string_view arg = argv[index] ? argv[index] : "";
        auto take_value = [&](std::string &target) -> bool
        {
            if (index + 1 >= argc || argv[index + 1] == nullptr)
            {
                std::fprintf(stderr, "kidcached: %.*s needs a value\n",
                             static_cast<int>(arg.size()), arg.data());
                return false;
            }
            target = argv[++index];
            return true;
        };
        if (arg == "--help" || arg == "-h")
        {
            options.help = true;
        }
        else if (arg == "--sync-now")
        {
            options.sync_now = true;
        }
        else if (arg == "--data-dir")
        {
            if (!take_value(options.data_dir))
                return std::nullopt;
        }
        else if (arg == "--server")
        {
            if (!take_value(options.server))
                return std::nullopt;
        }
        else if (arg == "--user")
        {
            if (!take_value(options.user))
                return std::nullopt;
        }
        else if (arg == "--password")
        {
            if (!take_value(options.password))
                return std::nullopt;
        }
        else if (arg == "--library")
        {
            std::string library;
            if (!take_value(library))
                return std::nullopt;
            options.libraries.push_back(trim_whitespace(std::move(library)));
        }
        else
        {
            std::fprintf(stderr, "kidcached: unknown option %.*s\n",
                         static_cast<int>(arg.size()), arg.data());
            return std::nullopt;
        }
    }

    // Flags win over the environment.
    if (options.data_dir.empty())
        options.data_dir = read_env("KC_DATA_DIR").value_or("");
    if (options.server.empty())
        options.server = read_env("KC_SERVER_URL").value_or("");
    if (options.user.empty())
        options.user = read_env("KC_USERNAME").value_or("");
    if (options.password.empty())
        options.password = read_env("KC_PASSWORD").value_or("");
    if (options.libraries.empty())
    {
        if (auto raw = read_env("KC_LIBRARIES"))
            options.libraries = split_list(*raw);
    }
    return options;
}

std::string describe(kc::engine::ConnectOutcome const &outcome)
{
    using kc::engine::ConnectStatus;
    switch (outcome.status)
    {
    case ConnectStatus::Connected:
        return "connected";
    case ConnectStatus::UntrustedCertificate:
        return "server certificate is not trusted (key " +
               outcome.fingerprint + "); confirm it from the parent screen";
    case ConnectStatus::InvalidCredentials:
        return "invalid username or password";
    case ConnectStatus::Unreachable:
        return "server unreachable: " + outcome.message;
    }
    return "unknown";
}

std::string status_line(kc::engine::Core const &engine)
{
    auto const sync = engine.sync_status();
    auto const downloads = engine.download_status();
    std::size_t queued = 0;
    for (auto const &task : downloads.tasks)
    {
        if (task.is_live())
            ++queued;
    }
    std::string line = "network=";
    line += kc::engine::to_string(engine.network_state());
    line += " sync=";
    line += sync.in_progress
                ? "running"
                : (sync.last_result
                       ? std::string(kc::engine::to_string(sync.last_result->status))
                       : std::string("never"));
    line += " downloads=" + std::to_string(queued);
    if (downloads.active_item)
    {
        line += " active=" + *downloads.active_item + " (" +
                std::to_string(static_cast<int>(downloads.active_progress * 100)) +
                "%)";
    }
    if (downloads.storage_blocked)
        line += " storage-blocked";
    if (downloads.reconnect_required)
        line += " reconnect-required";
    return line;
}

} // namespace

namespace kc::app
{

int daemon_main(int argc, char *argv[])
{
    try
    {
        auto options = parse_options(argc, argv);
        if (!options)
        {
            std::fputs(kUsage, stderr);
            return 2;
        }
        if (options->help)
        {
            std::fputs(kUsage, stdout);
            return 0;
        }

        std::signal(SIGINT, [](int sig) { kc::runtime::request_shutdown(sig); });
        std::signal(SIGTERM,
                    [](int sig) { kc::runtime::request_shutdown(sig); });

        kc::engine::CoreSettings settings;
        if (!options->data_dir.empty())
        {
            settings.data_dir = options->data_dir;
            kc::log::set_log_directory(options->data_dir);
        }
        settings.enabled_libraries = options->libraries;

        KC_LOG_INFO("{} starting", kc::version::kDisplayVersion);
        auto engine = kc::engine::Core::create(std::move(settings),
                                               kc::engine::CoreDependencies{});
        std::thread engine_thread([core = engine.get()] { core->run(); });
        KC_LOG_INFO("Engine thread started");

        if (!options->server.empty() && !options->user.empty())
        {
            auto outcome =
                engine->connect(options->server, options->user,
                                options->password);
            kc::log::print_status("kidcached: {}", describe(outcome));
        }
        else if (!options->server.empty())
        {
            kc::log::print_status(
                "kidcached: --server given without --user; using the stored "
                "session");
        }

        if (options->sync_now)
        {
            auto pending = engine->manual_sync();
            while (!kc::runtime::should_shutdown() &&
                   pending.wait_for(std::chrono::milliseconds(200)) !=
                       std::future_status::ready)
            {
            }
            if (pending.wait_for(std::chrono::seconds(0)) ==
                std::future_status::ready)
            {
                auto const result = pending.get();
                kc::log::print_status(
                    "kidcached: sync {} (+{} ~{} -{})",
                    kc::engine::to_string(result.status), result.added.size(),
                    result.updated.size(), result.removed.size());
            }
        }

        kc::log::print_status("KidCache daemon running; CTRL+C to stop.");

        std::string last_line;
        auto next_report = std::chrono::steady_clock::now();
        while (!kc::runtime::should_shutdown())
        {
            auto const now = std::chrono::steady_clock::now();
            if (now >= next_report)
            {
                auto line = status_line(*engine);
                if (line != last_line)
                {
                    kc::log::print_status("{}", line);
                    last_line = std::move(line);
                }
                next_report = now + std::chrono::seconds(5);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        KC_LOG_INFO("Shutdown requested (signal {}); stopping engine...",
                    kc::runtime::shutdown_signal());
        engine->stop();
        if (engine_thread.joinable())
        {
            engine_thread.join();
        }
        engine.reset();

        kc::log::print_status("Shutdown complete.");
        KC_LOG_INFO("Shutdown complete.");
        return 0;
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "KidCache daemon failed: %s\n", ex.what());
        KC_LOG_ERROR("daemon failed: {}", ex.what());
    }
    return 1;
}

} // namespace kc::app
