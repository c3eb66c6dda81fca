// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

// ---

enum sc_log_level
{
    // No logging at all
    SC_LOG_OFF,

    // Errors that prevent seedctl from running
    SC_LOG_CRITICAL,

    // A command failed, e.g. a rejected value or an unreachable daemon
    SC_LOG_ERROR,

    // Smaller problems that don't stop the current command
    SC_LOG_WARN,

    // User-visible info, e.g. the echo of a new rate limit
    SC_LOG_INFO,

    // Debug messages
    SC_LOG_DEBUG,

    // High-volume debug messages, e.g. every parsed number
    SC_LOG_TRACE
};

// "off", "critical", "error", "warn", "info", "debug" or "trace"
[[nodiscard]] std::optional<sc_log_level> sc_logGetLevelFromKey(std::string_view key);

[[nodiscard]] std::string_view sc_logLevelKey(sc_log_level level);

// ---

struct sc_log_message
{
    sc_log_level level = SC_LOG_OFF;

    // basename of the source file and the line that logged it
    std::string_view file;
    long line = 0;

    std::chrono::system_clock::time_point when;

    // the setting the message is about, or "file:line" if none was given
    std::string name;

    std::string message;
};

// Receives every message that passes the level filter.
// Without a sink, messages are printed to stderr.
using sc_log_sink = std::function<void(sc_log_message const&)>;

void sc_logSetSink(sc_log_sink sink);

// ---

void sc_logSetLevel(sc_log_level level);

[[nodiscard]] sc_log_level sc_logGetLevel();

[[nodiscard]] bool sc_logLevelIsActive(sc_log_level level);

// ---

void sc_logAddMessage(
    char const* source_file,
    long source_line,
    sc_log_level level,
    std::string&& msg,
    std::string_view setting_name = {});

#define sc_logAddLevel(level, ...) \
    do \
    { \
        if (sc_logLevelIsActive(level)) \
        { \
            sc_logAddMessage(__FILE__, __LINE__, level, __VA_ARGS__); \
        } \
    } while (0)

#define sc_logAddCritical(...) sc_logAddLevel(SC_LOG_CRITICAL, __VA_ARGS__)
#define sc_logAddError(...) sc_logAddLevel(SC_LOG_ERROR, __VA_ARGS__)
#define sc_logAddWarn(...) sc_logAddLevel(SC_LOG_WARN, __VA_ARGS__)
#define sc_logAddInfo(...) sc_logAddLevel(SC_LOG_INFO, __VA_ARGS__)
#define sc_logAddDebug(...) sc_logAddLevel(SC_LOG_DEBUG, __VA_ARGS__)
#define sc_logAddTrace(...) sc_logAddLevel(SC_LOG_TRACE, __VA_ARGS__)
