// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

#include "libseedctl/error-types.h"
#include "libseedctl/error.h"
#include "libseedctl/file.h"
#include "libseedctl/log.h"
#include "libseedctl/rcfile.h"
#include "libseedctl/utils.h"

using namespace std::literals;

namespace libseedctl
{
std::vector<std::string> rc_parse(std::string_view text)
{
    auto commands = std::vector<std::string>{};
    auto pending = std::string{};

    auto line = std::string_view{};
    while (sc_strv_sep(&text, &line, '\n'))
    {
        line = sc_strv_strip(line);

        if (std::empty(line) || sc_strv_starts_with(line, '#'))
        {
            continue;
        }

        auto const continues = sc_strv_ends_with(line, '\\');
        if (continues)
        {
            line = sc_strv_strip(line.substr(0, std::size(line) - 1U));
        }

        if (!std::empty(pending) && !std::empty(line))
        {
            pending += ' ';
        }
        pending += line;

        if (!continues)
        {
            commands.emplace_back(std::move(pending));
            pending.clear();
        }
    }

    // a continuation on the last line
    if (!std::empty(pending))
    {
        commands.emplace_back(std::move(pending));
    }

    return commands;
}

std::optional<std::vector<std::string>> rc_read(std::string_view filename, sc_error* error)
{
    auto contents = std::vector<char>{};
    auto local_error = sc_error{};
    if (!sc_file_read(filename, contents, &local_error))
    {
        sc_error_propagate_prefixed(error, std::move(local_error), fmt::format("{:s}: ", filename));
        return {};
    }

    return rc_parse(std::string_view{ std::data(contents), std::size(contents) });
}

bool rc_write(std::string_view filename, std::string_view content, bool force, sc_error* error)
{
    if (!force && sc_sys_path_exists(filename))
    {
        sc_error_set(error, SC_ERROR_EEXIST, fmt::format("File exists: {:s}", filename));
        return false;
    }

    if (auto const dir = sc_sys_path_dirname(filename); !std::empty(dir) && !sc_sys_dir_create(dir, 0777, error))
    {
        return false;
    }

    if (!sc_file_save(filename, content, error))
    {
        return false;
    }

    sc_logAddDebug(fmt::format("Wrote {:d} bytes to '{:s}'", std::size(content), filename));
    return true;
}

std::string rc_filepath(std::string_view file, std::string_view default_dir)
{
    auto const explicit_path = sc_strv_starts_with(file, '/') || sc_strv_starts_with(file, "./"sv) ||
        sc_strv_starts_with(file, '~');

    if (explicit_path || sc_sys_path_exists(file))
    {
        return sc_sys_path_expanduser(file);
    }

    return fmt::format("{:s}/{:s}", default_dir, file);
}

std::string rc_quote(std::string_view str)
{
    static auto constexpr Special = " \t\n'\"\\#;"sv;

    if (std::empty(str))
    {
        return "''";
    }

    auto const needs_quotes = std::any_of(
        std::begin(str),
        std::end(str),
        [](char ch) { return sc_strv_contains(Special, ch); });

    if (!needs_quotes)
    {
        return std::string{ str };
    }

    if (!sc_strv_contains(str, '\''))
    {
        return fmt::format("'{:s}'", str);
    }

    auto quoted = std::string{ "\"" };
    for (auto const ch : str)
    {
        if (ch == '"' || ch == '\\')
        {
            quoted += '\\';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

} // namespace libseedctl
