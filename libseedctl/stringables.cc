// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <cstddef>
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
#include "libseedctl/file.h"
#include "libseedctl/log.h"
#include "libseedctl/stringables.h"
#include "libseedctl/utils.h"

using namespace std::literals;

namespace libseedctl
{
namespace
{
[[nodiscard]] std::string_view resolve_alias(std::string_view value, Aliases const& aliases)
{
    if (auto const iter = aliases.find(value); iter != std::end(aliases))
    {
        return iter->second;
    }

    return value;
}

template<typename Container>
[[nodiscard]] bool contains(Container const& container, std::string_view key)
{
    return std::find(std::begin(container), std::end(container), key) != std::end(container);
}

// split on the separator with surrounding whitespace ignored, dropping empty items
void split_items(std::string_view value, std::string_view sep, std::vector<std::string>& setme)
{
    sep = sc_strv_strip(sep);

    if (std::empty(sep))
    {
        sep = " "sv;
    }

    while (!std::empty(value))
    {
        if (auto const item = sc_strv_strip(sc_strv_sep(&value, sep)); !std::empty(item))
        {
            setme.emplace_back(item);
        }
    }
}

[[nodiscard]] std::string join_input(Input const& input, std::string_view sep)
{
    if (auto const* const str = std::get_if<std::string>(&input); str != nullptr)
    {
        return *str;
    }

    if (auto const* const list = std::get_if<std::vector<std::string>>(&input); list != nullptr)
    {
        return fmt::format("{}", fmt::join(*list, sep));
    }

    return std::get<Number>(input).to_string(true, true);
}

[[nodiscard]] std::optional<Number> convert_number(Number const& prototype, Input const& input, sc_error* error)
{
    auto const convert_to = is_data_unit(prototype.unit()) ? prototype.unit() : ""sv;

    if (auto const* const number = std::get_if<Number>(&input); number != nullptr)
    {
        auto config = prototype.config();
        if (!std::empty(number->unit()))
        {
            config.unit = number->unit();
        }

        return Number::make(number->value(), prototype.type(), std::move(config), convert_to, error);
    }

    return Number::parse(join_input(input, " "sv), prototype.type(), prototype.config(), convert_to, error);
}

} // namespace

// --- String

std::optional<String> String::make(std::string_view value, Config config, sc_error* error)
{
    auto const len = sc_strv_utf8_length(value);

    if (len > config.maxlen)
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Too long (maximum length is {:d})", config.maxlen));
        return {};
    }

    if (len < config.minlen)
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Too short (minimum length is {:d})", config.minlen));
        return {};
    }

    return String{ std::string{ value }, config };
}

std::string String::syntax() const
{
    auto const [minlen, maxlen] = config_;
    auto const bounded = maxlen != Unlimited;
    auto const chrstr = (minlen <= 1U && (maxlen == 1U || !bounded)) ? "character"sv : "characters"sv;

    if (minlen > 0U && bounded)
    {
        return minlen == maxlen ? fmt::format("string ({:d} {:s})", minlen, chrstr) :
                                  fmt::format("string ({:d}-{:d} {:s})", minlen, maxlen, chrstr);
    }

    if (minlen > 0U)
    {
        return fmt::format("string (at least {:d} {:s})", minlen, chrstr);
    }

    if (bounded)
    {
        return fmt::format("string (at most {:d} {:s})", maxlen, chrstr);
    }

    return "string"s;
}

// --- Bool

std::optional<Bool> Bool::make(std::string_view value, Config config, sc_error* error)
{
    if (contains(config.true_words, value))
    {
        return Bool{ true, std::move(config) };
    }

    if (contains(config.false_words, value))
    {
        return Bool{ false, std::move(config) };
    }

    sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Not a boolean value: '{:s}'", value));
    return {};
}

std::string Bool::to_string() const
{
    auto const& words = value_ ? config_.true_words : config_.false_words;
    return std::empty(words) ? std::string{} : words.front();
}

std::string Bool::syntax() const
{
    auto pairs = std::vector<std::string>{};

    auto const n = std::min(std::size(config_.true_words), std::size(config_.false_words));
    for (size_t i = 0; i < n; ++i)
    {
        if (auto pair = fmt::format("{:s}/{:s}", config_.true_words[i], config_.false_words[i]); !contains(pairs, pair))
        {
            pairs.emplace_back(std::move(pair));
        }
    }

    return fmt::format("{}", fmt::join(pairs, "|"));
}

// --- Path

std::optional<Path> Path::make(std::string_view value, Config config, sc_error* error)
{
    auto path = sc_sys_path_normalize(sc_sys_path_expanduser(value));

    if (config.mustexist && !sc_sys_path_exists(path))
    {
        sc_error_set(error, SC_ERROR_VALIDATION, "No such file or directory"s);
        return {};
    }

    return Path{ std::move(path), config };
}

std::string Path::to_string() const
{
    auto home = sc_sys_path_home();
    if (std::empty(home))
    {
        return value_;
    }

    // "/home/u/" -> "/home/u"
    home = sc_sys_path_normalize(home);
    if (home == "/"sv)
    {
        return value_;
    }

    if (value_ == home)
    {
        return "~"s;
    }

    if (auto const home_dir = home + '/'; sc_strv_starts_with(value_, home_dir))
    {
        return fmt::format("~/{:s}", std::string_view{ value_ }.substr(std::size(home_dir)));
    }

    return value_;
}

std::string_view Path::syntax()
{
    return "file system path"sv;
}

// --- Tuple

std::optional<Tuple> Tuple::make(std::vector<std::string> const& values, Config config, sc_error* error)
{
    auto split = std::vector<std::string>{};
    for (auto const& value : values)
    {
        split_items(value, config.sep, split);
    }

    auto items = std::vector<std::string>{};
    items.reserve(std::size(split));
    for (auto const& item : split)
    {
        auto resolved = std::string{ resolve_alias(item, config.aliases) };

        if (config.dedup && contains(items, resolved))
        {
            continue;
        }

        items.emplace_back(std::move(resolved));
    }

    if (config.options)
    {
        auto invalid = std::vector<std::string_view>{};
        for (auto const& item : items)
        {
            if (!contains(*config.options, item))
            {
                invalid.emplace_back(item);
            }
        }

        if (!std::empty(invalid))
        {
            sc_error_set(
                error,
                SC_ERROR_VALIDATION,
                fmt::format(
                    "Invalid option{:s}: {}",
                    std::size(invalid) != 1U ? "s" : "",
                    fmt::join(invalid, config.sep)));
            return {};
        }
    }

    return Tuple{ std::move(items), std::move(config) };
}

std::optional<Tuple> Tuple::make(std::string_view value, Config config, sc_error* error)
{
    return make(std::vector<std::string>{ std::string{ value } }, std::move(config), error);
}

std::string Tuple::to_string() const
{
    return fmt::format("{}", fmt::join(items_, config_.sep));
}

std::string Tuple::syntax() const
{
    auto const sep = sc_strv_strip(config_.sep);
    return fmt::format("<OPTION>{0:s}<OPTION>{0:s}...", sep);
}

// --- Option

std::optional<Option> Option::make(std::string_view value, Config config, sc_error* error)
{
    auto resolved = std::string{ resolve_alias(value, config.aliases) };

    if (!contains(config.options, resolved))
    {
        sc_error_set(error, SC_ERROR_VALIDATION, fmt::format("Not one of: {}", fmt::join(config.options, ", ")));
        return {};
    }

    return Option{ std::move(resolved), std::move(config) };
}

std::string Option::syntax() const
{
    return fmt::format("{}", fmt::join(config_.options, "|"));
}

// ---

std::optional<Value> convert(Value const& prototype, Input const& input, sc_error* error)
{
    auto const text = [&input]()
    {
        return join_input(input, " "sv);
    };

    if (auto const* const proto = std::get_if<Number>(&prototype); proto != nullptr)
    {
        if (auto number = convert_number(*proto, input, error); number)
        {
            return Value{ std::move(*number) };
        }
    }
    else if (auto const* const proto = std::get_if<Tuple>(&prototype); proto != nullptr)
    {
        auto const* const list = std::get_if<std::vector<std::string>>(&input);
        auto tuple = list != nullptr ? Tuple::make(*list, proto->config(), error) :
                                       Tuple::make(text(), proto->config(), error);
        if (tuple)
        {
            return Value{ std::move(*tuple) };
        }
    }
    else if (auto const* const proto = std::get_if<String>(&prototype); proto != nullptr)
    {
        if (auto str = String::make(text(), proto->config(), error); str)
        {
            return Value{ std::move(*str) };
        }
    }
    else if (auto const* const proto = std::get_if<Bool>(&prototype); proto != nullptr)
    {
        if (auto boolean = Bool::make(text(), proto->config(), error); boolean)
        {
            return Value{ std::move(*boolean) };
        }
    }
    else if (auto const* const proto = std::get_if<Path>(&prototype); proto != nullptr)
    {
        if (auto path = Path::make(text(), proto->config(), error); path)
        {
            return Value{ std::move(*path) };
        }
    }
    else if (auto const* const proto = std::get_if<Option>(&prototype); proto != nullptr)
    {
        if (auto option = Option::make(text(), proto->config(), error); option)
        {
            return Value{ std::move(*option) };
        }
    }

    return {};
}

std::string to_string(Value const& value)
{
    return std::visit([](auto const& val) { return std::string{ val.to_string() }; }, value);
}

std::string to_string(Input const& input)
{
    return join_input(input, ", "sv);
}

std::string syntax(Value const& value)
{
    return std::visit([](auto const& val) { return std::string{ val.syntax() }; }, value);
}

} // namespace libseedctl
