// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace libseedctl
{
class Context;

// Every command returns false on failure and reports why through Context::error().

// `set` lists all settings; `set NAME[:eval] VALUE...` changes one.
bool cmd_set(Context& ctx, std::vector<std::string> const& args);

// Reset each named setting to its default. Keeps going after a failure.
bool cmd_reset(Context& ctx, std::vector<std::string> const& names);

/**
 * Show or change transfer rate limits.
 *
 * `directions` is a comma-separated list of "up", "down" or "dn".
 * An empty `limit` or "show" shows the current limits.
 * No filters, or the single filter "global", means the daemon's global limits.
 */
bool cmd_ratelimit(
    Context& ctx,
    std::string_view directions,
    std::string_view limit,
    std::vector<std::string> const& filters,
    bool quiet = false);

// The rc file text that reproduces the current settings and key bindings.
[[nodiscard]] std::string dump_rc(Context& ctx);

// Write dump_rc() to `file`, or show it if `file` is empty.
bool cmd_dump(Context& ctx, std::string_view file, bool force = false);

// Run every command in an rc file through the Context's CommandRunner.
bool cmd_rc(Context& ctx, std::string_view file);

// Dispatch a tokenized command line, e.g. { "ratelimit", "up", "+=100k" }.
bool run_command(Context& ctx, std::vector<std::string> const& argv);

} // namespace libseedctl
