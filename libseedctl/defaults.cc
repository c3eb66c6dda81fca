// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "libseedctl/converter.h"
#include "libseedctl/defaults.h"
#include "libseedctl/error-types.h"
#include "libseedctl/error.h"
#include "libseedctl/file.h"
#include "libseedctl/sc-assert.h"
#include "libseedctl/settings.h"
#include "libseedctl/stringables.h"
#include "libseedctl/transfer-api.h"
#include "libseedctl/utils.h"
#include "libseedctl/version.h"

using namespace std::literals;

namespace libseedctl
{
namespace
{
auto constexpr UnlimitedLiterals = std::array<std::string_view, 4>{ "off"sv, "none"sv, "unlimited"sv, "∞"sv };

auto const TorrentColumns = std::vector<std::string>{
    "marked",   "size",      "downloaded", "uploaded", "ratio",           "seeds",           "connections",
    "status",   "eta",       "progress",   "rate-down", "rate-up",        "limit-rate-down", "limit-rate-up",
    "name",     "path",      "tracker",    "error",     "peers",          "added",           "created",
};

auto const PeerColumns = std::vector<std::string>{
    "torrent", "host", "port", "ip", "client", "country", "progress", "rate-down", "rate-up", "rate-est", "eta",
};

auto const FileColumns = std::vector<std::string>{
    "marked", "priority", "progress", "downloaded", "size", "name",
};

// catalog entries are constants; a value that fails to construct is a programming error
template<typename T>
[[nodiscard]] Value checked(std::optional<T>&& value)
{
    SC_ASSERT(value.has_value());
    return Value{ std::move(*value) };
}

[[nodiscard]] Value make_string(std::string_view value, size_t minlen = 0U, size_t maxlen = String::Unlimited)
{
    auto config = String::Config{};
    config.minlen = minlen;
    config.maxlen = maxlen;
    return checked(String::make(value, config));
}

[[nodiscard]] Value make_integer(double value, double min, double max = Number::Infinity)
{
    auto config = Number::Config{};
    config.min = min;
    config.max = max;
    return checked(Number::make(value, Number::Type::Integer, std::move(config)));
}

[[nodiscard]] Value make_float(double value, double min)
{
    auto config = Number::Config{};
    config.min = min;
    return checked(Number::make(value, Number::Type::Float, std::move(config)));
}

[[nodiscard]] Value make_columns(std::vector<std::string> const& value, std::vector<std::string> const& options)
{
    auto config = Tuple::Config{};
    config.options = options;
    config.dedup = true;
    return checked(Tuple::make(value, std::move(config)));
}

[[nodiscard]] Value make_option(std::string_view value, std::vector<std::string> options)
{
    auto config = Option::Config{};
    config.options = std::move(options);
    return checked(Option::make(value, std::move(config)));
}

[[nodiscard]] Value make_rate_prototype(DataCountConverter const& bandwidth)
{
    auto config = Number::Config{};
    config.unit = bandwidth.unit();
    config.prefix = bandwidth.prefix();
    config.min = 0;
    return checked(Number::make(Number::Infinity, Number::Type::Float, std::move(config)));
}

[[nodiscard]] std::string xdg_dir(std::string_view env_key, std::string_view fallback)
{
    auto base = sc_env_get_string(env_key);
    if (std::empty(base))
    {
        base = fmt::format("{:s}/{:s}", sc_sys_path_home(), fallback);
    }

    return fmt::format("{:s}/{:s}", base, SEEDCTL_NAME);
}

// remote settings that map one-to-one onto a daemon setting
[[nodiscard]] RemoteAccessor make_accessor(SettingsApi& api, std::string key, Value prototype, std::string description)
{
    auto fetch = [&api, key, prototype](sc_error* error) -> std::optional<Value>
    {
        auto const raw = api.get(key, error);
        if (!raw)
        {
            if (error != nullptr && !*error)
            {
                error->set(SC_ERROR_CONNECTIVITY, fmt::format("No value for '{:s}'", key));
            }
            return {};
        }

        return convert(prototype, *raw, error);
    };

    auto push = [&api, key](Value const& value, sc_error* error)
    {
        return api.set(key, value, error);
    };

    return RemoteAccessor{ std::move(prototype), std::move(description), std::move(fetch), std::move(push), {} };
}

[[nodiscard]] RemoteAccessor make_rate_accessor(
    SettingsApi& api,
    DataCountConverter const& bandwidth,
    Direction direction,
    std::string description)
{
    auto fetch = [&api, &bandwidth, direction](sc_error* error) -> std::optional<Value>
    {
        auto const limit = api.limit_rate(direction, error);
        if (!limit)
        {
            return {};
        }

        auto converted = bandwidth(*limit, error);
        if (!converted)
        {
            return {};
        }

        return Value{ std::move(*converted) };
    };

    auto push = [&api, direction](Value const& value, sc_error* error)
    {
        auto const* const limit = as_number(value);
        SC_ASSERT(limit != nullptr);
        return limit != nullptr && api.set_limit_rate(direction, *limit, error);
    };

    // user input goes through the bandwidth converter so "1Mb" becomes bytes when the unit is bytes
    auto coerce = [&bandwidth](Input const& input, sc_error* error) -> std::optional<Value>
    {
        auto limit = std::optional<Number>{};

        if (auto const* const number = std::get_if<Number>(&input); number != nullptr)
        {
            limit = bandwidth(*number, error);
        }
        else if (auto const text = to_string(input); is_unlimited_literal(text))
        {
            limit = bandwidth(Number::Infinity, {}, error);
        }
        else
        {
            limit = bandwidth(text, {}, error);
        }

        if (!limit)
        {
            return {};
        }

        auto config = limit->config();
        config.min = 0;
        auto bounded = Number::make(limit->value(), Number::Type::Float, std::move(config), {}, error);
        if (!bounded)
        {
            return {};
        }

        return Value{ std::move(*bounded) };
    };

    return RemoteAccessor{
        make_rate_prototype(bandwidth),
        std::move(description),
        std::move(fetch),
        std::move(push),
        std::move(coerce),
    };
}

} // namespace

std::string default_config_dir()
{
    return xdg_dir("XDG_CONFIG_HOME"sv, ".config"sv);
}

std::string default_cache_dir()
{
    return xdg_dir("XDG_CACHE_HOME"sv, ".cache"sv);
}

std::string default_rc_file()
{
    return fmt::format("{:s}/rc", default_config_dir());
}

std::string default_history_file()
{
    return fmt::format("{:s}/history", default_cache_dir());
}

bool is_unlimited_literal(std::string_view str)
{
    auto const key = sc_strlower(sc_strv_strip(str));
    return std::find(std::begin(UnlimitedLiterals), std::end(UnlimitedLiterals), key) != std::end(UnlimitedLiterals);
}

std::vector<LocalSetting> local_catalog()
{
    auto catalog = std::vector<LocalSetting>{};

    catalog.push_back({ "connect.host", make_string("localhost"), "Hostname or IP of Transmission RPC interface" });
    catalog.push_back({ "connect.port", make_integer(9091, 1, 65535), "Port of Transmission RPC interface" });
    catalog.push_back({ "connect.path", make_string("/transmission/rpc"), "Path of Transmission RPC interface" });
    catalog.push_back({ "connect.user", make_string(""), "Username to use for authentication with Transmission RPC interface" });
    catalog.push_back(
        { "connect.password", make_string(""), "Password to use for authentication with Transmission RPC interface" });
    catalog.push_back(
        { "connect.tls", checked(Bool::make("false")), "Whether to connect via HTTPS to the Transmission RPC interface" });
    catalog.push_back(
        { "connect.timeout", make_float(10, 0), "Number of seconds before connecting to Transmission RPC interface fails" });

    catalog.push_back({ "columns.torrents",
                        make_columns(
                            { "marked",
                              "size",
                              "downloaded",
                              "uploaded",
                              "ratio",
                              "seeds",
                              "connections",
                              "status",
                              "eta",
                              "progress",
                              "rate-down",
                              "rate-up",
                              "name" },
                            TorrentColumns),
                        "List of columns in new torrent lists" });
    catalog.push_back({ "columns.peers",
                        make_columns({ "progress", "rate-down", "rate-up", "rate-est", "eta", "ip", "client" }, PeerColumns),
                        "List of columns in new peer lists" });
    catalog.push_back({ "columns.files",
                        make_columns({ "marked", "priority", "progress", "downloaded", "size", "name" }, FileColumns),
                        "List of columns in new torrent file lists" });

    catalog.push_back({ "tui.theme",
                        checked(Path::make(fmt::format("{:s}/default.theme", default_config_dir()))),
                        "Path to theme file" });
    catalog.push_back({ "tui.log.height", make_integer(10, 1), "Maximum height of the log section" });
    catalog.push_back(
        { "tui.log.autohide",
          make_float(10, 0),
          "If the log is hidden, show it for this many seconds for new log entries before hiding it again" });
    catalog.push_back(
        { "tui.cli.history-file", checked(Path::make(default_history_file())), "Path to TUI command line history file" });
    catalog.push_back({ "tui.poll", make_float(5, 0.1), "Interval in seconds between TUI updates" });

    catalog.push_back({ "unit.bandwidth", make_option("byte", { "bit", "byte" }), "Unit for bandwidth rates ('bit' or 'byte')" });
    catalog.push_back({ "unitprefix.bandwidth",
                        make_option("metric", { "metric", "binary" }),
                        "Unit prefix for bandwidth rates ('metric' or 'binary')" });
    catalog.push_back({ "unit.size", make_option("byte", { "bit", "byte" }), "Unit for sizes ('bit' or 'byte')" });
    catalog.push_back(
        { "unitprefix.size", make_option("binary", { "metric", "binary" }), "Unit prefix for sizes ('metric' or 'binary')" });

    catalog.push_back({ "tui.marked.on",
                        make_string("✔", 1U, 1U),
                        "Character displayed in \"marked\" column for marked list items (see \"mark\" command)" });
    catalog.push_back({ "tui.marked.off",
                        make_string(" ", 1U, 1U),
                        "Character displayed in \"marked\" column for unmarked list items (see \"mark\" command)" });

    return catalog;
}

std::vector<std::pair<std::string, RemoteAccessor>> remote_catalog(SettingsApi& api, DataCountConverter const& bandwidth)
{
    auto const boolean = checked(Bool::make("false"));
    auto const path = checked(Path::make("/"));

    auto encryption = Option::Config{};
    encryption.options = { "required", "preferred", "tolerated" };

    auto catalog = std::vector<std::pair<std::string, RemoteAccessor>>{};
    auto const add = [&catalog](std::string name, RemoteAccessor&& accessor)
    {
        catalog.emplace_back(std::move(name), std::move(accessor));
    };

    add("srv.utp",
        make_accessor(api, "utp", boolean, "Whether to use Micro Transport Protocol to mitigate latency issues"));
    add("srv.dht",
        make_accessor(api, "dht", boolean, "Whether to use Distributed Hash Tables to discover peers for public torrents"));
    add("srv.lpd",
        make_accessor(api, "lpd", boolean, "Whether to use Local Peer Discovery to discover peers for public torrents"));
    add("srv.pex", make_accessor(api, "pex", boolean, "Whether to use Peer Exchange to discover peers for public torrents"));

    add("srv.port", make_accessor(api, "port", make_integer(51413, 1, 65535), "Port used to communicate with peers"));
    add("srv.port-forwarding",
        make_accessor(
            api,
            "port_forwarding",
            boolean,
            "Whether to instruct your router to forward the peer port via UPnP or NAT-PMP"));

    add("srv.encryption",
        make_accessor(
            api,
            "encryption",
            checked(Option::make("preferred", std::move(encryption))),
            "Protocol encryption policy; \"required\", \"preferred\" or \"tolerated\""));

    add("srv.limit.peers.global",
        make_accessor(api, "peer_limit_global", make_integer(0, 0), "Maximum number of connections for all torrents combined"));
    add("srv.limit.peers.torrent",
        make_accessor(api, "peer_limit_torrent", make_integer(0, 0), "Maximum number of connections for a single torrent"));

    add("srv.limit.rate.up", make_rate_accessor(api, bandwidth, Direction::Up, "Combined upload rate limit"));
    add("srv.limit.rate.down", make_rate_accessor(api, bandwidth, Direction::Down, "Combined download rate limit"));

    add("srv.part-files",
        make_accessor(api, "part_files", boolean, "Whether to append \".part\" to incomplete file names"));
    add("srv.path.complete", make_accessor(api, "path_complete", path, "Where to put torrent files"));
    add("srv.path.incomplete", make_accessor(api, "path_incomplete", path, "Where to put incomplete torrent files"));

    add("srv.autostart-torrents",
        make_accessor(api, "autostart_torrents", boolean, "Automatically start torrents when they are added"));

    return catalog;
}

} // namespace libseedctl
