// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "libseedctl/error-types.h"
#include "libseedctl/error.h"
#include "libseedctl/log.h"
#include "libseedctl/utils.h"
#include "libseedctl/values.h"

using namespace std::literals;

namespace libseedctl
{
namespace
{
auto constexpr PrefixKeys = std::array<std::pair<std::string_view, Prefix>, 2>{ {
    { "metric"sv, Prefix::Metric },
    { "binary"sv, Prefix::Binary },
} };

auto constexpr InfinitySymbol = "∞"sv;

// "2.50" -> "2.5", "2.00" -> "2"
void strip_trailing_zeros(std::string& str)
{
    if (str.find('.') == std::string::npos || str.find('e') != std::string::npos)
    {
        return;
    }

    while (sc_strv_ends_with(str, '0'))
    {
        str.pop_back();
    }

    if (sc_strv_ends_with(str, '.'))
    {
        str.pop_back();
    }
}

[[nodiscard]] double round_to(double value, int decimal_places)
{
    auto const factor = std::pow(10.0, decimal_places);
    return std::round(value * factor) / factor;
}

[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs)
{
    return std::size(lhs) == std::size(rhs) &&
        std::equal(
               std::begin(lhs),
               std::end(lhs),
               std::begin(rhs),
               [](char a, char b)
               { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
}

// consume a case-insensitive magnitude prefix from the front of `str`
[[nodiscard]] std::optional<std::pair<Prefix, uint64_t>> take_multiplier(std::string_view* str)
{
    // two-character binary prefixes first so "Ki" is not read as "k" + unit "i"
    for (auto const prefix : { Prefix::Binary, Prefix::Metric })
    {
        for (auto const& [name, size] : Values::multipliers(prefix))
        {
            if (iequals(str->substr(0, std::size(name)), name))
            {
                str->remove_prefix(std::size(name));
                return std::make_pair(prefix, size);
            }
        }
    }

    return {};
}

// consume `\d+\.\d+|\d+|\.\d+` from the front of `str`
[[nodiscard]] std::optional<double> take_digits(std::string_view* str)
{
    auto constexpr Digits = "0123456789"sv;

    auto int_len = str->find_first_not_of(Digits);
    int_len = int_len == std::string_view::npos ? std::size(*str) : int_len;

    auto len = int_len;
    if (len < std::size(*str) && (*str)[len] == '.' && len + 1U < std::size(*str) &&
        Digits.find((*str)[len + 1U]) != std::string_view::npos)
    {
        auto const frac_end = str->find_first_not_of(Digits, len + 1U);
        len = frac_end == std::string_view::npos ? std::size(*str) : frac_end;
    }

    if (len == 0U)
    {
        return {};
    }

    auto token = std::string{ int_len == 0U ? "0" : "" };
    token += str->substr(0, len);
    str->remove_prefix(len);
    return sc_num_parse<double>(token);
}

// the shortest form of `value` that parses back to it, without an exponent:
// "1e-07" -> "0.0000001", "1.5e+20" -> "150000000000000000000"
[[nodiscard]] std::string format_fixed(double value)
{
    auto str = fmt::format("{}", value);

    auto const e_pos = str.find('e');
    if (e_pos == std::string::npos)
    {
        return str;
    }

    auto exponent_str = std::string_view{ str }.substr(e_pos + 1U);
    if (sc_strv_starts_with(exponent_str, '+'))
    {
        exponent_str.remove_prefix(1);
    }

    auto const exponent = sc_num_parse<int>(exponent_str);
    if (!exponent)
    {
        return fmt::format("{:f}", value);
    }

    auto mantissa = std::string_view{ str }.substr(0, e_pos);
    auto const negative = sc_strv_starts_with(mantissa, '-');
    if (negative)
    {
        mantissa.remove_prefix(1);
    }

    auto digits = std::string{};
    auto point = std::size(mantissa);
    for (auto const ch : mantissa)
    {
        if (ch == '.')
        {
            point = std::size(digits);
        }
        else
        {
            digits += ch;
        }
    }

    auto const shifted = static_cast<long>(point) + *exponent;
    auto const n_digits = static_cast<long>(std::size(digits));

    auto out = std::string{ negative ? "-" : "" };
    if (shifted <= 0)
    {
        out += "0.";
        out.append(static_cast<size_t>(-shifted), '0');
        out += digits;
    }
    else if (shifted >= n_digits)
    {
        out += digits;
        out.append(static_cast<size_t>(shifted - n_digits), '0');
    }
    else
    {
        auto const split = static_cast<size_t>(shifted);
        out += std::string_view{ digits }.substr(0, split);
        out += '.';
        out += std::string_view{ digits }.substr(split);
    }

    return out;
}

[[nodiscard]] std::string format_bound(double bound)
{
    return format_fixed(bound);
}

} // namespace

std::string_view to_string(Prefix prefix) noexcept
{
    for (auto const& [key, value] : PrefixKeys)
    {
        if (value == prefix)
        {
            return key;
        }
    }

    return {};
}

std::optional<Prefix> prefix_from_string(std::string_view str) noexcept
{
    for (auto const& [key, value] : PrefixKeys)
    {
        if (key == str)
        {
            return value;
        }
    }

    return {};
}

std::string_view canonical_unit(std::string_view unit) noexcept
{
    if (unit == "bit"sv)
    {
        return "b"sv;
    }

    if (unit == "byte"sv)
    {
        return "B"sv;
    }

    return unit;
}

// ---

std::string Values::pretty_float(double value)
{
    auto const abs = std::fabs(value);

    if (std::isinf(abs))
    {
        return value < 0 ? fmt::format("-{:s}", InfinitySymbol) : std::string{ InfinitySymbol };
    }

    if (abs == 0.0)
    {
        return "0"s;
    }

    auto const abs_r2 = round_to(abs, 2);
    if (abs_r2 == std::floor(abs))
    {
        return fmt::format("{:.0f}", value);
    }

    auto str = std::string{};
    if (abs_r2 < 10.0)
    {
        str = fmt::format("{:.2f}", value);
    }
    else if (round_to(abs, 1) < 100.0)
    {
        str = fmt::format("{:.1f}", value);
    }
    else
    {
        return fmt::format("{:.0f}", value);
    }

    strip_trailing_zeros(str);
    return str;
}

// ---

std::optional<Number> Number::make(double value, Type type, Config config, std::string_view convert_to, sc_error* error)
{
    config.unit = std::string{ canonical_unit(config.unit) };

    if (std::isnan(value))
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Not a number: '{}'", value));
        return {};
    }

    if (auto const target = canonical_unit(convert_to); !std::empty(target) && config.unit != target)
    {
        if (std::empty(config.unit))
        {
            // no unit, so assume the value is already in the target unit
            sc_logAddTrace(fmt::format("Assuming {} is already in '{:s}'", value, target));
        }
        else if (config.unit == "B"sv && target == "b"sv)
        {
            value *= 8;
        }
        else if (config.unit == "b"sv && target == "B"sv)
        {
            value /= 8;
        }
        else
        {
            sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Cannot convert {:s} to {:s}", config.unit, target));
            return {};
        }

        config.unit = std::string{ target };
    }

    if (type == Type::Integer)
    {
        if (std::isfinite(value))
        {
            value = std::nearbyint(value);
        }
        else
        {
            // infinity has no integer form
            type = Type::Float;
        }
    }

    if (value < config.min)
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Too small (minimum is {:s})", format_bound(config.min)));
        return {};
    }

    if (value > config.max)
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Too big (maximum is {:s})", format_bound(config.max)));
        return {};
    }

    return Number{ value, type, std::move(config) };
}

std::optional<Number> Number::parse(std::string_view str, Type type, Config config, std::string_view convert_to, sc_error* error)
{
    auto const original = str;
    auto const not_a_number = [&error, original]()
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Not a number: '{:s}'", original));
        return std::nullopt;
    };

    str = sc_strv_strip(str);

    auto negative = false;
    if (sc_strv_starts_with(str, '+') || sc_strv_starts_with(str, '-'))
    {
        negative = str.front() == '-';
        str.remove_prefix(1);
    }

    auto value = double{};
    if (iequals(str.substr(0, 3), "inf"sv))
    {
        value = Infinity;
        str.remove_prefix(3);
    }
    else if (sc_strv_starts_with(str, InfinitySymbol))
    {
        value = Infinity;
        str.remove_prefix(std::size(InfinitySymbol));
    }
    else if (auto const digits = take_digits(&str); digits)
    {
        value = *digits;
    }
    else
    {
        return not_a_number();
    }

    if (sc_strv_starts_with(str, ' '))
    {
        str.remove_prefix(1);
    }

    auto const multiplier = take_multiplier(&str);

    // whatever is left is the unit
    if (str.find_first_of(" \t\n\r\f\v0123456789"sv) != std::string_view::npos)
    {
        return not_a_number();
    }

    if (!std::empty(str))
    {
        config.unit = std::string{ str };
    }

    if (multiplier)
    {
        auto const [prefix, size] = *multiplier;
        value *= static_cast<double>(size);
        config.prefix = prefix;
    }

    if (negative)
    {
        value = -value;
    }

    sc_logAddTrace(fmt::format(
        "Parsed '{:s}' to {}, unit='{:s}', prefix={:s}",
        original,
        value,
        config.unit,
        libseedctl::to_string(config.prefix)));

    return make(value, type, std::move(config), convert_to, error);
}

bool Number::is_infinite() const noexcept
{
    return std::isinf(value_);
}

Number Number::with_bounds(double min, double max) const
{
    auto config = config_;
    config.min = min;
    config.max = max;
    return Number{ value_, type_, std::move(config) };
}

std::string_view Number::syntax()
{
    return "[+|-]<NUMBER>[Ti|Gi|Mi|Ki|T|G|M|k]"sv;
}

std::string Number::to_string() const
{
    return to_string(!config_.hide_unit, config_.precise);
}

std::string Number::to_string(bool with_unit, bool precise) const
{
    if (value_ == 0)
    {
        return "0"s;
    }

    if (is_infinite())
    {
        return Values::pretty_float(value_);
    }

    auto const unit = with_unit ? std::string_view{ config_.unit } : ""sv;

    if (precise)
    {
        auto str = format_fixed(value_);
        strip_trailing_zeros(str);
        return str.append(unit);
    }

    auto const abs = std::fabs(value_);
    for (auto const& [name, size] : Values::multipliers(config_.prefix))
    {
        if (abs >= static_cast<double>(size))
        {
            return fmt::format("{:s}{:s}{:s}", Values::pretty_float(value_ / static_cast<double>(size)), name, unit);
        }
    }

    return fmt::format("{:s}{:s}", Values::pretty_float(value_), unit);
}

// ---

double Number::operand(Number const& that) const
{
    auto const mine = unit();
    auto const theirs = that.unit();

    if (mine == "B"sv && theirs == "b"sv)
    {
        return that.value_ / 8;
    }

    if (mine == "b"sv && theirs == "B"sv)
    {
        return that.value_ * 8;
    }

    return that.value_;
}

template<typename Op>
std::optional<Number> Number::do_math(Op op, sc_error* error) const
{
    // infinity stays infinite; there is no integer variant to narrow to
    auto const result = value_ >= Infinity ? Infinity : op(value_);

    auto const narrowed = std::isfinite(result) && result == std::floor(result);
    return make(result, narrowed ? Type::Integer : Type::Float, config_, {}, error);
}

std::optional<Number> Number::add(Number const& that, sc_error* error) const
{
    return do_math([rhs = operand(that)](double lhs) { return lhs + rhs; }, error);
}

std::optional<Number> Number::subtract(Number const& that, sc_error* error) const
{
    return do_math([rhs = operand(that)](double lhs) { return lhs - rhs; }, error);
}

std::optional<Number> Number::multiply(Number const& that, sc_error* error) const
{
    return do_math([rhs = that.value_](double lhs) { return lhs * rhs; }, error);
}

std::optional<Number> Number::divide(Number const& that, sc_error* error) const
{
    if (that.value_ == 0)
    {
        sc_error_set(error, SC_ERROR_VALIDATION, "Division by zero"s);
        return {};
    }

    return do_math([rhs = that.value_](double lhs) { return lhs / rhs; }, error);
}

std::optional<Number> Number::floor(sc_error* error) const
{
    return do_math([](double val) { return std::floor(val); }, error);
}

std::optional<Number> Number::ceil(sc_error* error) const
{
    return do_math([](double val) { return std::ceil(val); }, error);
}

std::optional<Number> Number::round(sc_error* error) const
{
    return do_math([](double val) { return std::nearbyint(val); }, error);
}

} // namespace libseedctl
