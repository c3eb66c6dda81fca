// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string>
#include <string_view>

struct sc_error;

/**
 * @addtogroup file_io File IO
 * @{
 */

/**
 * @brief Portability wrapper for `access()`.
 *
 * @param[in]  path  Path to file or directory.
 * @param[out] error Pointer to error object. Optional, pass `nullptr` if you
 *                   are not interested in error details.
 *
 * @return `True` if path exists, `false` otherwise. Note that `false` will also
 *         be returned in case of error; if you need to distinguish the two,
 *         check if `error` is set afterwards.
 */
bool sc_sys_path_exists(std::string_view path, sc_error* error = nullptr);

/**
 * @brief Check whether path is relative.
 *
 * This function only analyzes the string, so no error reporting is needed.
 */
[[nodiscard]] bool sc_sys_path_is_relative(std::string_view path);

/**
 * @brief Portability wrapper for `basename()`.
 *
 * @return base name (last path component; parent path removed).
 */
[[nodiscard]] std::string_view sc_sys_path_basename(std::string_view path);

/**
 * @brief Portability wrapper for `dirname()`.
 *
 * @return parent path substring of `path` (last path component removed).
 */
[[nodiscard]] std::string_view sc_sys_path_dirname(std::string_view path);

/**
 * @brief Lexically collapse `.`, `..` and repeated separators.
 *
 * Does not touch the file system; symbolic links are not resolved.
 */
[[nodiscard]] std::string sc_sys_path_normalize(std::string_view path);

/** @brief The current user's home directory, from `$HOME` or the password database. */
[[nodiscard]] std::string sc_sys_path_home();

/** @brief Replace a leading `~` or `~/` with the home directory. */
[[nodiscard]] std::string sc_sys_path_expanduser(std::string_view path);

/**
 * @brief Create a directory and any missing parents.
 *
 * @return `True` on success or if the directory already exists.
 */
bool sc_sys_dir_create(std::string_view path, int permissions, sc_error* error = nullptr);

/** @} */
