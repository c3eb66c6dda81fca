// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "libseedctl/transfer-api.h"
#include "libseedctl/utils.h"

using namespace std::literals;

namespace libseedctl
{
namespace
{
auto constexpr DirectionKeys = std::array<std::pair<std::string_view, Direction>, 3>{ {
    { "up"sv, Direction::Up },
    { "down"sv, Direction::Down },
    { "dn"sv, Direction::Down },
} };
} // namespace

std::string_view to_string(Direction direction) noexcept
{
    return direction == Direction::Up ? "up"sv : "down"sv;
}

std::optional<Direction> direction_from_string(std::string_view str)
{
    auto const key = sc_strlower(sc_strv_strip(str));

    for (auto const& [name, direction] : DirectionKeys)
    {
        if (key == name)
        {
            return direction;
        }
    }

    return {};
}

} // namespace libseedctl
