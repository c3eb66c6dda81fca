// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "libseedctl/values.h"

struct sc_error;

namespace libseedctl
{
/**
 * Normalizes data counts to one unit (bits or bytes) and one prefix table.
 *
 * A raw number without a unit is taken to be in the converter's unit.
 */
class DataCountConverter
{
public:
    DataCountConverter() = default;

    DataCountConverter(std::string_view unit, Prefix prefix, sc_error* error = nullptr);

    // "b" or "B"
    [[nodiscard]] auto unit() const noexcept
    {
        return std::string_view{ unit_ };
    }

    [[nodiscard]] constexpr auto prefix() const noexcept
    {
        return prefix_;
    }

    // accepts "bit", "byte", "b" or "B"
    bool set_unit(std::string_view unit, sc_error* error = nullptr);

    // accepts "metric" or "binary"
    bool set_prefix(std::string_view prefix, sc_error* error = nullptr);

    constexpr void set_prefix(Prefix prefix) noexcept
    {
        prefix_ = prefix;
    }

    [[nodiscard]] std::optional<Number> operator()(std::string_view str, std::string_view unit = {}, sc_error* error = nullptr)
        const;

    [[nodiscard]] std::optional<Number> operator()(double value, std::string_view unit = {}, sc_error* error = nullptr) const;

    [[nodiscard]] std::optional<Number> operator()(Number const& num, sc_error* error = nullptr) const;

private:
    [[nodiscard]] Number::Config config_for(std::string_view unit) const;

    std::string unit_ = "B";
    Prefix prefix_ = Prefix::Metric;
};

} // namespace libseedctl
