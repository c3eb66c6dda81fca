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
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/format.h>

#include "libseedctl/error-types.h"
#include "libseedctl/error.h"
#include "libseedctl/log.h"
#include "libseedctl/settings.h"
#include "libseedctl/subprocess.h"
#include "libseedctl/utils.h"
#include "libseedctl/value-resolution.h"

using namespace std::literals;

namespace libseedctl
{
namespace
{
using OperatorFunc = std::optional<Number> (*)(Number const&, Number const&, sc_error*);

struct OperatorInfo
{
    Operator op;
    std::string_view symbol;
    OperatorFunc func;
};

auto constexpr Operators = std::array<OperatorInfo, 2>{ {
    { Operator::Add,
      "+="sv,
      [](Number const& lhs, Number const& rhs, sc_error* error) { return lhs.add(rhs, error); } },
    { Operator::Subtract,
      "-="sv,
      [](Number const& lhs, Number const& rhs, sc_error* error) { return lhs.subtract(rhs, error); } },
} };

[[nodiscard]] constexpr OperatorInfo const& info(Operator op) noexcept
{
    return op == Operator::Add ? Operators[0] : Operators[1];
}

[[nodiscard]] std::string_view strip_newlines(std::string_view str)
{
    while (sc_strv_starts_with(str, '\n'))
    {
        str.remove_prefix(1);
    }

    while (sc_strv_ends_with(str, '\n'))
    {
        str.remove_suffix(1);
    }

    return str;
}

// the value that decides how raw input is shaped; remote settings may not have one yet
[[nodiscard]] Value const* current_or_prototype(CombinedSettings& settings, std::string_view name)
{
    if (auto const* const value = settings.get(name); value != nullptr)
    {
        return value;
    }

    return settings.remote().prototype(name);
}

// Add or subtract `delta` from `current`. On a bounds violation, the message shows the result as it
// would have been without bounds.
[[nodiscard]] std::optional<Number> adjust_value(
    std::string_view name,
    Number const& current,
    Operator op,
    Number const& delta,
    sc_error* error)
{
    // arithmetic with infinity can't round-trip through the integer variant
    auto base = std::optional<Number>{ current };
    if (current.is_infinite())
    {
        auto config = current.config();
        config.min = -Number::Infinity;
        config.max = Number::Infinity;
        base = Number::make(0, Number::Type::Integer, std::move(config));
    }

    auto local_error = sc_error{};
    if (auto result = apply(op, *base, delta, &local_error); result)
    {
        return result;
    }

    auto const unbounded = apply(op, base->with_bounds(-Number::Infinity, Number::Infinity), delta);
    auto const attempted = unbounded ? unbounded->to_string() : fmt::format("{:s}{:s}", info(op).symbol, delta.to_string());
    sc_error_propagate_prefixed(error, std::move(local_error), fmt::format("{:s} = {:s}: ", name, attempted));
    return {};
}
} // namespace

std::string_view to_string(Operator op) noexcept
{
    return info(op).symbol;
}

std::optional<Number> apply(Operator op, Number const& current, Number const& delta, sc_error* error)
{
    return info(op).func(current, delta, error);
}

std::string_view strip_eval_suffix(std::string_view name, bool* is_eval)
{
    static auto constexpr Suffix = ":eval"sv;

    auto const has_suffix = sc_strv_ends_with(name, Suffix);
    if (has_suffix)
    {
        name.remove_suffix(std::size(Suffix));
    }

    if (is_eval != nullptr)
    {
        *is_eval = has_suffix;
    }

    return name;
}

std::optional<std::string> eval_shell(std::string_view command, sc_error* error, Evaluator const& evaluator)
{
    sc_logAddDebug(fmt::format("Running shell command: '{:s}'", command));

    auto const result = evaluator ? evaluator(command, error) : sc_spawn_capture(command, error);
    if (!result)
    {
        return {};
    }

    if (auto const err = strip_newlines(result->err); !std::empty(err))
    {
        sc_error_set(error, SC_ERROR_SHELL, std::string{ err });
        return {};
    }

    return std::string{ strip_newlines(result->out) };
}

std::vector<std::string> listify_args(std::vector<std::string> const& args)
{
    auto items = std::vector<std::string>{};

    for (auto const& arg : args)
    {
        auto sv = std::string_view{ arg };
        auto token = std::string_view{};
        while (sc_strv_sep(&sv, &token, ','))
        {
            if (auto const item = sc_strv_strip(token); !std::empty(item))
            {
                items.emplace_back(item);
            }
        }
    }

    return items;
}

std::optional<OperatorSplit> split_operator(std::string_view literal, sc_error* error)
{
    auto const stripped = sc_strv_strip(literal);
    if (std::size(stripped) < 3U)
    {
        return OperatorSplit{};
    }

    for (auto const& [op, symbol, func] : Operators)
    {
        if (!sc_strv_starts_with(stripped, symbol))
        {
            continue;
        }

        auto const operand = stripped.substr(std::size(symbol));
        auto local_error = sc_error{};
        auto delta = Number::parse(operand, Number::Type::Float, {}, {}, &local_error);
        if (!delta)
        {
            sc_error_propagate(error, std::move(local_error));
            return {};
        }

        return OperatorSplit{ op, std::move(delta) };
    }

    return OperatorSplit{};
}

bool set_setting(
    CombinedSettings& settings,
    std::string_view name_in,
    std::vector<std::string> const& args,
    sc_error* error,
    Evaluator const& evaluator)
{
    auto is_eval = false;
    auto const name = std::string{ strip_eval_suffix(name_in, &is_eval) };

    if (!settings.contains(name))
    {
        sc_error_set(error, SC_ERROR_NOT_FOUND, fmt::format("Unknown setting: {:s}", name));
        return false;
    }

    // fetch the current value in case it is displayed or adjusted
    if (settings.is_remote(name) && !settings.update(error))
    {
        return false;
    }

    auto const* const current = current_or_prototype(settings, name);
    if (current == nullptr)
    {
        sc_error_set(error, SC_ERROR_CONNECTIVITY, fmt::format("{:s}: value is not available", name));
        return false;
    }

    auto raw = args;
    if (is_eval)
    {
        auto local_error = sc_error{};
        auto output = eval_shell(fmt::format("{}", fmt::join(args, " ")), &local_error, evaluator);
        if (!output)
        {
            sc_error_propagate_prefixed(error, std::move(local_error), fmt::format("{:s}: ", name));
            return false;
        }

        raw = { std::move(*output) };
    }

    auto input = Input{};
    if (is_sequence(*current))
    {
        input = listify_args(raw);
    }
    else
    {
        auto literal = fmt::format("{}", fmt::join(raw, " "));

        // "+=" and "-=" only mean something for numbers; anything else is taken literally
        if (auto const* const number = as_number(*current); number != nullptr)
        {
            auto local_error = sc_error{};
            auto const split = split_operator(literal, &local_error);
            if (!split)
            {
                sc_error_propagate_prefixed(error, std::move(local_error), fmt::format("{:s} = {:s}: ", name, literal));
                return false;
            }

            if (split->op)
            {
                auto adjusted = adjust_value(name, *number, *split->op, *split->delta, error);
                if (!adjusted)
                {
                    return false;
                }

                input = std::move(*adjusted);
            }
            else
            {
                input = std::move(literal);
            }
        }
        else
        {
            input = std::move(literal);
        }
    }

    auto local_error = sc_error{};
    if (settings.set(name, input, &local_error))
    {
        return true;
    }

    if (sc_error_is_connectivity(local_error.code()))
    {
        sc_error_propagate(error, std::move(local_error));
    }
    else
    {
        sc_error_propagate_prefixed(error, std::move(local_error), fmt::format("{:s} = {:s}: ", name, to_string(input)));
    }

    return false;
}

} // namespace libseedctl
