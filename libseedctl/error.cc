// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <string>
#include <string_view>
#include <utility>

#include "libseedctl/error.h"
#include "libseedctl/utils.h" // for sc_strerror()

void sc_error::set_from_errno(int errnum)
{
    set(errnum, sc_strerror(errnum));
}

void sc_error_set(sc_error* error, int code, std::string message)
{
    if (error != nullptr)
    {
        error->set(code, std::move(message));
    }
}

void sc_error_propagate(sc_error* tgt, sc_error&& src)
{
    if (tgt != nullptr)
    {
        *tgt = std::move(src);
    }
}

void sc_error_propagate_prefixed(sc_error* tgt, sc_error&& src, std::string_view prefix)
{
    if (tgt != nullptr)
    {
        src.prefix_message(prefix);
        *tgt = std::move(src);
    }
}
