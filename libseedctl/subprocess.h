// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <optional>
#include <string>
#include <string_view>

struct sc_error;

struct sc_spawn_result
{
    // as returned by waitpid(); see WIFEXITED() and friends
    int status = 0;

    std::string out;
    std::string err;
};

// Run `command` with /bin/sh and wait for it to finish, capturing its standard output and error.
// Fails only if the process could not be started or waited on.
[[nodiscard]] std::optional<sc_spawn_result> sc_spawn_capture(std::string_view command, sc_error* error = nullptr);

// The exit code of a finished process, or -1 if it was killed by a signal.
[[nodiscard]] int sc_spawn_exit_code(sc_spawn_result const& result) noexcept;
