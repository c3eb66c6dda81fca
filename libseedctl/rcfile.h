// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sc_error;

namespace libseedctl
{
/**
 * Read the commands in an rc file.
 *
 * Blank lines and lines starting with '#' are skipped.
 * A line ending with '\' continues on the next line.
 */
[[nodiscard]] std::optional<std::vector<std::string>> rc_read(std::string_view filename, sc_error* error = nullptr);

// Split rc file text into commands. See rc_read().
[[nodiscard]] std::vector<std::string> rc_parse(std::string_view text);

// Write `content` to `filename`, creating its parent directory if needed.
// Fails with EEXIST if the file exists and `force` is false.
bool rc_write(std::string_view filename, std::string_view content, bool force, sc_error* error = nullptr);

/**
 * Where an rc file argument points to.
 *
 * A path that doesn't exist and doesn't start with '/', './' or '~' is
 * taken relative to `default_dir`.
 */
[[nodiscard]] std::string rc_filepath(std::string_view file, std::string_view default_dir);

// Quote `str` so the command line parser reads it back as one argument.
[[nodiscard]] std::string rc_quote(std::string_view str);

} // namespace libseedctl
