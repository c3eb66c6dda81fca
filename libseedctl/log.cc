// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "libseedctl/file.h"
#include "libseedctl/log.h"
#include "libseedctl/utils.h"

using namespace std::literals;

namespace
{
auto constexpr LogKeys = std::array<std::pair<std::string_view, sc_log_level>, 7>{ {
    { "off"sv, SC_LOG_OFF },
    { "critical"sv, SC_LOG_CRITICAL },
    { "error"sv, SC_LOG_ERROR },
    { "warn"sv, SC_LOG_WARN },
    { "info"sv, SC_LOG_INFO },
    { "debug"sv, SC_LOG_DEBUG },
    { "trace"sv, SC_LOG_TRACE },
} };

[[nodiscard]] constexpr bool keys_are_ordered()
{
    for (size_t i = 0; i < std::size(LogKeys); ++i)
    {
        if (LogKeys[i].second != static_cast<sc_log_level>(i))
        {
            return false;
        }
    }

    return true;
}

static_assert(keys_are_ordered());

struct LogState
{
    std::mutex mutex;
    sc_log_level level = SC_LOG_ERROR;
    sc_log_sink sink;
};

[[nodiscard]] LogState& log_state()
{
    static auto state = LogState{};
    return state;
}

// 2024-05-01T12:34:56.789+0200 [warn] tui.poll: message
void print_to_stderr(sc_log_message const& msg)
{
    auto const subseconds = msg.when - std::chrono::time_point_cast<std::chrono::seconds>(msg.when);
    fmt::print(
        stderr,
        "{0:%FT%T.}{1:0>3%Q}{0:%z} [{2:s}] {3:s}: {4:s}\n",
        fmt::localtime(std::chrono::system_clock::to_time_t(msg.when)),
        std::chrono::duration_cast<std::chrono::milliseconds>(subseconds),
        sc_logLevelKey(msg.level),
        msg.name,
        msg.message);
}
} // namespace

std::optional<sc_log_level> sc_logGetLevelFromKey(std::string_view key)
{
    auto const lowered = sc_strlower(sc_strv_strip(key));

    for (auto const& [name, level] : LogKeys)
    {
        if (lowered == name)
        {
            return level;
        }
    }

    return {};
}

std::string_view sc_logLevelKey(sc_log_level level)
{
    auto const idx = static_cast<size_t>(level);
    return idx < std::size(LogKeys) ? LogKeys[idx].first : "?"sv;
}

void sc_logSetSink(sc_log_sink sink)
{
    auto& state = log_state();
    auto const lock = std::lock_guard{ state.mutex };
    state.sink = std::move(sink);
}

void sc_logSetLevel(sc_log_level level)
{
    auto& state = log_state();
    auto const lock = std::lock_guard{ state.mutex };
    state.level = level;
}

sc_log_level sc_logGetLevel()
{
    auto& state = log_state();
    auto const lock = std::lock_guard{ state.mutex };
    return state.level;
}

bool sc_logLevelIsActive(sc_log_level level)
{
    return level != SC_LOG_OFF && sc_logGetLevel() >= level;
}

void sc_logAddMessage(char const* source_file, long source_line, sc_log_level level, std::string&& msg, std::string_view setting_name)
{
    if (std::empty(msg) || !sc_logLevelIsActive(level))
    {
        return;
    }

    // logging must not clobber the errno a caller is about to report
    auto const saved_errno = errno;

    auto message = sc_log_message{};
    message.level = level;
    message.file = sc_sys_path_basename(source_file != nullptr ? source_file : "");
    if (std::empty(message.file))
    {
        message.file = "?"sv;
    }
    message.line = source_line;
    message.when = std::chrono::system_clock::now();
    message.name = std::empty(setting_name) ? fmt::format("{:s}:{:d}", message.file, source_line) :
                                              std::string{ setting_name };
    message.message = std::move(msg);

    // copy the sink so it may log or replace itself without deadlocking
    auto sink = sc_log_sink{};
    {
        auto& state = log_state();
        auto const lock = std::lock_guard{ state.mutex };
        sink = state.sink;
    }

    if (sink)
    {
        sink(message);
    }
    else
    {
        print_to_stderr(message);
    }

    errno = saved_errno;
}
