// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/format.h>

#include "libseedctl/commands.h"
#include "libseedctl/context.h"
#include "libseedctl/error-types.h"
#include "libseedctl/error.h"
#include "libseedctl/keymap.h"
#include "libseedctl/log.h"
#include "libseedctl/rcfile.h"
#include "libseedctl/settings.h"
#include "libseedctl/stringables.h"
#include "libseedctl/transfer-api.h"
#include "libseedctl/utils.h"
#include "libseedctl/value-resolution.h"
#include "libseedctl/version.h"

using namespace std::literals;

namespace libseedctl
{
namespace
{
auto constexpr DumpWidth = size_t{ 79U };

auto constexpr Unavailable = "<unavailable>"sv;

// --- ratelimit

[[nodiscard]] std::optional<std::vector<Direction>> parse_directions(Context const& ctx, std::string_view str)
{
    auto directions = std::vector<Direction>{};

    auto token = std::string_view{};
    while (sc_strv_sep(&str, &token, ','))
    {
        auto const dir = direction_from_string(sc_strv_strip(token));
        if (!dir)
        {
            ctx.error(fmt::format("Invalid direction: '{:s}'", sc_strlower(sc_strv_strip(token))));
            return {};
        }

        directions.push_back(*dir);
    }

    return directions;
}

[[nodiscard]] bool is_global(std::vector<std::string> const& filters)
{
    return std::empty(filters) || (std::size(filters) == 1U && filters.front() == "global"sv);
}

[[nodiscard]] std::string limit_setting_name(Direction dir)
{
    return fmt::format("srv.limit.rate.{:s}", to_string(dir));
}

// daemon messages are shown; errors are always shown
void report(Context const& ctx, TorrentResponse const& response, bool quiet)
{
    if (!quiet)
    {
        for (auto const& msg : response.messages)
        {
            ctx.info(msg);
        }
    }

    for (auto const& msg : response.errors)
    {
        ctx.error(msg);
    }
}

bool show_global_limits(Context& ctx, std::vector<Direction> const& directions)
{
    for (auto const dir : directions)
    {
        auto error = sc_error{};
        auto const limit = ctx.settings_api().limit_rate(dir, &error);
        if (!limit)
        {
            ctx.error(error.message());
            return false;
        }

        auto const converted = ctx.bandwidth()(*limit);
        ctx.info(fmt::format("Global {:s}load rate limit: {:s}", to_string(dir), (converted ? *converted : *limit).to_string()));
    }

    return true;
}

bool show_individual_limits(Context& ctx, std::vector<std::string> const& filters, std::vector<Direction> const& directions)
{
    auto const response = ctx.torrent_api().torrents(filters, { "name", "limit-rate-up", "limit-rate-down" });
    report(ctx, response, true);

    if (!response.success)
    {
        return false;
    }

    for (auto const& torrent : response.torrents)
    {
        auto const name_it = torrent.find("name"sv);
        auto const name = name_it != std::end(torrent) ? std::string_view{ name_it->second } : "?"sv;

        for (auto const dir : directions)
        {
            auto const key = fmt::format("limit-rate-{:s}", to_string(dir));
            auto const limit_it = torrent.find(key);
            auto const limit = limit_it != std::end(torrent) ? std::string_view{ limit_it->second } : Unavailable;
            ctx.info(fmt::format("{:s} {:s}load rate limit: {:s}", name, to_string(dir), limit));
        }
    }

    return true;
}

bool set_global_limits(Context& ctx, std::vector<Direction> const& directions, std::string_view limit, bool quiet)
{
    auto success = true;

    for (auto const dir : directions)
    {
        auto const name = limit_setting_name(dir);
        sc_logAddDebug(fmt::format("Setting global {:s} rate limit: '{:s}'", to_string(dir), limit));

        auto error = sc_error{};
        if (!set_setting(ctx.settings(), name, { std::string{ limit } }, &error, ctx.evaluator()))
        {
            ctx.error(error.message());
            success = false;
            continue;
        }

        if (!quiet)
        {
            auto const* const value = ctx.settings().get(name);
            ctx.info(fmt::format(
                "Global {:s}load rate limit: {:s}",
                to_string(dir),
                value != nullptr ? to_string(*value) : std::string{ Unavailable }));
        }
    }

    return success;
}

bool set_individual_limits(
    Context& ctx,
    std::vector<std::string> const& filters,
    std::vector<Direction> const& directions,
    std::string_view limit,
    bool quiet)
{
    // "+=1M" becomes "+1M" so the daemon side can parse it as a signed number
    auto const adjust = sc_strv_starts_with(limit, "+="sv) || sc_strv_starts_with(limit, "-="sv);
    auto const value = adjust ? fmt::format("{:c}{:s}", limit.front(), limit.substr(2)) : std::string{ limit };

    auto names = std::vector<std::string_view>{};
    std::transform(
        std::begin(directions),
        std::end(directions),
        std::back_inserter(names),
        [](Direction dir) { return to_string(dir); });
    sc_logAddDebug(fmt::format(
        "Setting {}load rate limit for {} torrents: '{:s}'",
        fmt::join(names, "+"),
        fmt::join(filters, " "),
        value));

    auto success = true;
    for (auto const dir : directions)
    {
        auto const response = adjust ? ctx.torrent_api().adjust_limit_rate(filters, dir, value) :
                                       ctx.torrent_api().set_limit_rate(filters, dir, value);
        report(ctx, response, quiet);
        success = success && response.success;
    }

    return success;
}

// --- dump

[[nodiscard]] std::vector<std::string> wrap_description(std::string_view description)
{
    return sc_strv_wrap(fmt::format("# {:s}", description), DumpWidth, "# "sv);
}

[[nodiscard]] std::vector<std::string> wrap_default(std::string_view value)
{
    static auto constexpr Prefix = "# Default: "sv;
    auto const indent = fmt::format("# {:{}s}", "", std::size("Default: "sv));

    auto lines = sc_strv_wrap(fmt::format("{:s}{:s}", Prefix, value), DumpWidth, indent);

    // the first line always starts the value, even if it gets too long
    if (std::size(lines) >= 2U && sc_strv_strip(lines[0]) == sc_strv_strip(Prefix))
    {
        lines[0] += std::string_view{ lines[1] }.substr(std::size(indent) - 1U);
        lines.erase(std::begin(lines) + 1);
    }

    return lines;
}

[[nodiscard]] std::vector<std::string> wrap_set_cmd(std::string_view name, std::string_view value, bool escape)
{
    static auto constexpr Cmd = "set"sv;
    auto const indent = std::string(std::size(Cmd) + std::size(name) + 2U, ' ');

    auto lines = sc_strv_wrap(fmt::format("{:s} {:s} {:s}", Cmd, name, value), DumpWidth, indent);

    // the first line always holds the command, the name and the start of the value
    if (std::size(lines) >= 3U && sc_strv_strip(lines[0]) == Cmd)
    {
        lines[0] = fmt::format("{:s} {:s} {:s}", lines[0], sc_strv_strip(lines[1]), sc_strv_strip(lines[2]));
        lines.erase(std::begin(lines) + 1, std::begin(lines) + 3);
    }
    else if (std::size(lines) >= 2U && sc_strv_strip(lines[0]) == fmt::format("{:s} {:s}", Cmd, name))
    {
        lines[0] = fmt::format("{:s} {:s}", lines[0], sc_strv_strip(lines[1]));
        lines.erase(std::begin(lines) + 1);
    }

    for (size_t i = 0; i + 1U < std::size(lines); ++i)
    {
        lines[i] += " \\";
    }

    if (escape)
    {
        for (auto& line : lines)
        {
            line.insert(0, 1, '#');
        }
    }

    return lines;
}

[[nodiscard]] std::string dump_value(Value const& value)
{
    if (auto const* const tuple = std::get_if<Tuple>(&value); tuple != nullptr)
    {
        return fmt::format("{}", fmt::join(tuple->items(), " "));
    }

    // numbers are written in full so loading the file restores them exactly
    if (auto const* const number = as_number(value); number != nullptr)
    {
        return number->to_string(!number->config().hide_unit, true);
    }

    auto str = to_string(value);
    return sc_strv_contains(str, ' ') ? rc_quote(str) : str;
}

[[nodiscard]] std::string dump_settings(LocalSettings const& local)
{
    auto settings = std::vector<std::string>{};

    for (auto const& name : local.names())
    {
        auto const& value = *local.get(name);
        auto const& default_value = *local.default_value(name);
        auto const is_default = value == default_value;

        auto lines = wrap_description(local.description(name));
        for (auto& line : wrap_default(to_string(default_value)))
        {
            lines.emplace_back(std::move(line));
        }
        for (auto& line : wrap_set_cmd(name, dump_value(value), is_default))
        {
            lines.emplace_back(std::move(line));
        }

        settings.emplace_back(fmt::format("{}", fmt::join(lines, "\n")));
    }

    return fmt::format("{}", fmt::join(settings, "\n\n"));
}

[[nodiscard]] std::vector<std::string> wrap_bind_cmd(KeyBinding const& binding, bool escape)
{
    static auto constexpr Cmd = "bind"sv;

    auto lines = std::vector<std::vector<std::string>>{ { std::string{ Cmd } } };
    if (!std::empty(binding.description))
    {
        lines.back().insert(std::end(lines.back()), { "--description", rc_quote(binding.description), "\\" });
        lines.push_back({ std::string(std::size(Cmd), ' ') });
    }

    if (!std::empty(binding.context))
    {
        lines.back().insert(std::end(lines.back()), { "--context", rc_quote(binding.context) });
    }

    lines.back().emplace_back(rc_quote(binding.key));
    lines.back().emplace_back(binding.action);

    auto joined = std::vector<std::string>{};
    for (auto const& words : lines)
    {
        joined.emplace_back(fmt::format("{:s}{}", escape ? "#" : "", fmt::join(words, " ")));
    }

    return joined;
}

[[nodiscard]] std::string dump_keybindings(KeyMap const* keymap)
{
    if (keymap == nullptr)
    {
        return {};
    }

    auto contexts = std::vector<std::string>{};
    for (auto const& context : keymap->contexts())
    {
        auto lines = std::vector<std::string>{};
        for (auto const& binding : keymap->bindings(context))
        {
            for (auto& line : wrap_bind_cmd(binding, is_default_keybinding(binding)))
            {
                lines.emplace_back(std::move(line));
            }
        }

        contexts.emplace_back(fmt::format("{}", fmt::join(lines, "\n")));
    }

    return fmt::format("{}", fmt::join(contexts, "\n\n"));
}

// --- dispatch

using Args = std::vector<std::string>;
using Handler = bool (*)(Context&, Args const&);

// remove every occurrence of the given flags from `args`; returns true if one was found
[[nodiscard]] bool take_flag(Args& args, std::string_view long_flag, std::string_view short_flag)
{
    auto const old_size = std::size(args);
    args.erase(
        std::remove_if(
            std::begin(args),
            std::end(args),
            [&](auto const& arg) { return arg == long_flag || arg == short_flag; }),
        std::end(args));
    return std::size(args) != old_size;
}

bool run_set(Context& ctx, Args const& args)
{
    return cmd_set(ctx, args);
}

bool run_reset(Context& ctx, Args const& args)
{
    if (std::empty(args))
    {
        ctx.error("Missing NAME");
        return false;
    }

    return cmd_reset(ctx, args);
}

bool run_ratelimit(Context& ctx, Args const& args_in)
{
    auto args = args_in;
    auto const quiet = take_flag(args, "--quiet"sv, "-q"sv);

    auto const directions = !std::empty(args) ? args[0] : "up,down"s;
    auto const limit = std::size(args) >= 2U ? args[1] : ""s;
    auto const filters = std::size(args) >= 3U ? Args{ std::begin(args) + 2, std::end(args) } : Args{};
    return cmd_ratelimit(ctx, directions, limit, filters, quiet);
}

bool run_dump(Context& ctx, Args const& args_in)
{
    auto args = args_in;
    auto const force = take_flag(args, "--force"sv, "-f"sv);

    if (std::size(args) > 1U)
    {
        ctx.error(fmt::format("Unexpected argument: {:s}", args[1]));
        return false;
    }

    return cmd_dump(ctx, !std::empty(args) ? std::string_view{ args[0] } : ""sv, force);
}

bool run_rc(Context& ctx, Args const& args)
{
    if (std::size(args) != 1U)
    {
        ctx.error(std::empty(args) ? "Missing FILE"s : fmt::format("Unexpected argument: {:s}", args[1]));
        return false;
    }

    return cmd_rc(ctx, args[0]);
}

auto constexpr Commands = std::array<std::pair<std::string_view, Handler>, 8>{ {
    { "dump"sv, run_dump },
    { "rate"sv, run_ratelimit },
    { "ratelimit"sv, run_ratelimit },
    { "rc"sv, run_rc },
    { "reset"sv, run_reset },
    { "rl"sv, run_ratelimit },
    { "set"sv, run_set },
    { "source"sv, run_rc },
} };
} // namespace

bool cmd_set(Context& ctx, std::vector<std::string> const& args)
{
    auto& settings = ctx.settings();

    if (std::empty(args))
    {
        auto update_error = sc_error{};
        auto const updated = settings.update(&update_error);

        auto const names = settings.names();
        auto width = size_t{};
        for (auto const& name : names)
        {
            width = std::max(width, std::size(name));
        }

        for (auto const& name : names)
        {
            auto const* const value = settings.get(name);
            ctx.info(fmt::format(
                "{:<{}s} = {:s}",
                name,
                width,
                value != nullptr ? to_string(*value) : std::string{ Unavailable }));
        }

        if (!updated)
        {
            ctx.error(update_error.message());
            return false;
        }

        return true;
    }

    auto error = sc_error{};
    if (!set_setting(settings, args.front(), { std::begin(args) + 1, std::end(args) }, &error, ctx.evaluator()))
    {
        ctx.error(error.message());
        return false;
    }

    return true;
}

bool cmd_reset(Context& ctx, std::vector<std::string> const& names)
{
    auto success = true;

    for (auto const& name : listify_args(names))
    {
        if (auto error = sc_error{}; !ctx.settings().reset(name, &error))
        {
            ctx.error(error.message());
            success = false;
        }
    }

    return success;
}

bool cmd_ratelimit(
    Context& ctx,
    std::string_view directions_str,
    std::string_view limit_in,
    std::vector<std::string> const& filters,
    bool quiet)
{
    auto const directions = parse_directions(ctx, directions_str);
    if (!directions)
    {
        return false;
    }

    auto const limit = sc_strv_strip(limit_in);
    if (std::empty(limit) || limit == "show"sv)
    {
        return is_global(filters) ? show_global_limits(ctx, *directions) :
                                    show_individual_limits(ctx, filters, *directions);
    }

    return is_global(filters) ? set_global_limits(ctx, *directions, limit, quiet) :
                                set_individual_limits(ctx, filters, *directions, limit, quiet);
}

std::string dump_rc(Context& ctx)
{
    auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    auto const parts = std::array<std::string, 12>{
        fmt::format("# This is an rc file for {:s} {:s}.", SEEDCTL_NAME, SEEDCTL_VERSION_STRING),
        fmt::format("# This file was created on {:%Y-%m-%d %H:%M:%S}.", fmt::localtime(now)),
        "",
        "",
        "### SETTINGS",
        "",
        dump_settings(ctx.local()),
        "",
        "",
        "### KEYBINDINGS",
        "",
        dump_keybindings(ctx.keymap()),
    };

    return fmt::format("{}\n", fmt::join(parts, "\n"));
}

bool cmd_dump(Context& ctx, std::string_view file, bool force)
{
    auto const content = dump_rc(ctx);

    if (std::empty(file))
    {
        ctx.info(content);
        return true;
    }

    auto const path = rc_filepath(file, ctx.config_dir());

    if (auto error = sc_error{}; !rc_write(path, content, force, &error))
    {
        if (error.code() == SC_ERROR_EEXIST)
        {
            ctx.error(error.message());
        }
        else
        {
            ctx.error(fmt::format("Unable to write {:s}: {:s}", path, error.message()));
        }
        return false;
    }

    ctx.info(fmt::format("Wrote rc file: {:s}", path));
    return true;
}

bool cmd_rc(Context& ctx, std::string_view file)
{
    auto const path = rc_filepath(file, ctx.config_dir());

    auto error = sc_error{};
    auto const lines = rc_read(path, &error);
    if (!lines)
    {
        ctx.error(fmt::format("Loading rc file failed: {:s}", error.message()));
        return false;
    }

    auto* const runner = ctx.runner();
    if (runner == nullptr)
    {
        ctx.error(fmt::format("Loading rc file failed: no command runner for {:s}", path));
        return false;
    }

    sc_logAddDebug(fmt::format("Running commands from rc file: '{:s}'", path));
    for (auto const& line : *lines)
    {
        // nullopt means the line doesn't apply to the active interface
        if (auto const result = runner->run(line); result && !*result)
        {
            return false;
        }
    }

    return true;
}

bool run_command(Context& ctx, std::vector<std::string> const& argv)
{
    if (std::empty(argv))
    {
        return true;
    }

    auto const& name = argv.front();
    auto const it = std::find_if(
        std::begin(Commands),
        std::end(Commands),
        [&name](auto const& entry) { return entry.first == name; });

    if (it == std::end(Commands))
    {
        ctx.error(fmt::format("Unknown command: {:s}", name));
        return false;
    }

    return it->second(ctx, Args{ std::begin(argv) + 1, std::end(argv) });
}

} // namespace libseedctl
