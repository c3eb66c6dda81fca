// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string>
#include <string_view>
#include <utility>

/**
 * Why a command failed: an errno value or one of sc_error_code, plus a
 * message that is shown to the user as-is.
 *
 * Functions that can fail take a nullable `sc_error*` last and leave it
 * untouched on success.
 */
struct sc_error
{
public:
    sc_error() = default;

    sc_error(int code, std::string message)
        : message_{ std::move(message) }
        , code_{ code }
    {
    }

    [[nodiscard]] constexpr auto code() const noexcept
    {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept
    {
        return std::string_view{ message_ };
    }

    [[nodiscard]] constexpr operator bool() const noexcept
    {
        return code_ != 0;
    }

    void set(int code, std::string message)
    {
        code_ = code;
        message_ = std::move(message);
    }

    // "Too big (maximum is 65535)" -> "connect.port = 109k: Too big (maximum is 65535)"
    void prefix_message(std::string_view prefix)
    {
        message_.insert(0, prefix);
    }

    // `set(errnum, sc_strerror(errnum))`
    void set_from_errno(int errnum);

private:
    std::string message_;

    int code_ = 0;
};

// No-op if `error` is nullptr.
void sc_error_set(sc_error* error, int code, std::string message);

void sc_error_propagate(sc_error* tgt, sc_error&& src);

// Propagate `src` with `prefix` in front of its message, e.g. the rc file or setting it concerns.
void sc_error_propagate_prefixed(sc_error* tgt, sc_error&& src, std::string_view prefix);
