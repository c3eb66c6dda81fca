// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string_view>

#ifdef NDEBUG

#define SC_ASSERT(x) ((void)0)

#else

// Reports a broken internal invariant, such as a built-in catalog value that fails its own validation.
[[noreturn]] void sc_assert_fail(std::string_view expression, std::string_view file, long line);

#define SC_ASSERT(x) ((x) ? (void)0 : sc_assert_fail(#x, __FILE__, __LINE__))

#endif
