// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cerrno>

// Error codes for failures that do not come from the operating system.
// They are kept well above the errno range so both can share sc_error::code().
enum sc_error_code : int
{
    // malformed or out-of-constraint input to a value constructor
    SC_ERROR_VALIDATION = 0x5C0001,

    // a request to the daemon could not be completed
    SC_ERROR_CONNECTIVITY,

    // unknown setting name
    SC_ERROR_NOT_FOUND,

    // the operation is not supported for this setting, e.g. resetting a remote setting
    SC_ERROR_NOT_IMPLEMENTED,

    // an evaluated shell command wrote to standard error
    SC_ERROR_SHELL
};

#define SC_ERROR_EINVAL EINVAL
#define SC_ERROR_EEXIST EEXIST

[[nodiscard]] constexpr inline bool sc_error_is_validation(int code) noexcept
{
    return code == SC_ERROR_VALIDATION;
}

[[nodiscard]] constexpr inline bool sc_error_is_connectivity(int code) noexcept
{
    return code == SC_ERROR_CONNECTIVITY;
}

[[nodiscard]] constexpr inline bool sc_error_is_not_found(int code) noexcept
{
    return code == SC_ERROR_NOT_FOUND;
}

[[nodiscard]] constexpr inline bool sc_error_is_not_implemented(int code) noexcept
{
    return code == SC_ERROR_NOT_IMPLEMENTED;
}

[[nodiscard]] constexpr inline bool sc_error_is_shell(int code) noexcept
{
    return code == SC_ERROR_SHELL;
}

[[nodiscard]] constexpr inline bool sc_error_is_enoent(int code) noexcept
{
    return code == ENOENT;
}
