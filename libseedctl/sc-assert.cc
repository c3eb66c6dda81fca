// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#ifndef NDEBUG

#include <cstdio>
#include <cstdlib>
#include <string_view>

#include <fmt/core.h>

#include "libseedctl/sc-assert.h"

void sc_assert_fail(std::string_view expression, std::string_view file, long line)
{
    fmt::print(stderr, "seedctl: internal error at {:s}:{:d}: {:s}\n", file, line, expression);
    std::abort();
}

#endif
