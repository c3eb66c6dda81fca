// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "libseedctl/converter.h"
#include "libseedctl/error-types.h"
#include "libseedctl/error.h"
#include "libseedctl/log.h"
#include "libseedctl/values.h"

using namespace std::literals;

namespace libseedctl
{
DataCountConverter::DataCountConverter(std::string_view unit, Prefix prefix, sc_error* error)
    : prefix_{ prefix }
{
    set_unit(unit, error);
}

bool DataCountConverter::set_unit(std::string_view unit, sc_error* error)
{
    if (!is_data_unit(unit))
    {
        sc_error_set(error, SC_ERROR_VALIDATION, "Unit must be 'bit' or 'byte'"s);
        return false;
    }

    unit_ = canonical_unit(unit);
    return true;
}

bool DataCountConverter::set_prefix(std::string_view prefix, sc_error* error)
{
    if (auto const val = prefix_from_string(prefix); val)
    {
        prefix_ = *val;
        return true;
    }

    sc_error_set(error, SC_ERROR_VALIDATION, "Prefix must be 'binary' or 'metric'"s);
    return false;
}

Number::Config DataCountConverter::config_for(std::string_view unit) const
{
    auto config = Number::Config{};
    config.unit = std::empty(unit) ? unit_ : std::string{ canonical_unit(unit) };
    config.prefix = prefix_;
    return config;
}

std::optional<Number> DataCountConverter::operator()(std::string_view str, std::string_view unit, sc_error* error) const
{
    auto const num = Number::parse(str, Number::Type::Float, config_for(unit), {}, error);
    return num ? (*this)(*num, error) : std::nullopt;
}

std::optional<Number> DataCountConverter::operator()(double value, std::string_view unit, sc_error* error) const
{
    auto const num = Number::make(value, Number::Type::Float, config_for(unit), {}, error);
    return num ? (*this)(*num, error) : std::nullopt;
}

std::optional<Number> DataCountConverter::operator()(Number const& num, sc_error* error) const
{
    auto const unit_given = std::empty(num.unit()) ? std::string_view{ unit_ } : num.unit();

    if (!is_data_unit(unit_given))
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Unit must be 'b' (bit) or 'B' (byte), not '{:s}'", unit_given));
        return {};
    }

    auto config = Number::Config{};
    config.unit = num.unit();
    config.prefix = prefix_;
    config.hide_unit = num.config().hide_unit;

    sc_logAddTrace(fmt::format("Converting {:s} to '{:s}'", num.to_string(), unit_));
    return Number::make(num.value(), Number::Type::Float, std::move(config), unit_, error);
}

} // namespace libseedctl
