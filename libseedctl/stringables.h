// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <cstddef> // for size_t
#include <functional> // for std::less
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "libseedctl/values.h"

struct sc_error;

namespace libseedctl
{
using Aliases = std::map<std::string, std::string, std::less<>>;

struct StringConfig
{
    size_t minlen = 0U;
    size_t maxlen = std::numeric_limits<size_t>::max();
};

struct BoolConfig
{
    std::vector<std::string> true_words = { "enabled", "yes", "on", "true", "1" };
    std::vector<std::string> false_words = { "disabled", "no", "off", "false", "0" };
};

struct PathConfig
{
    bool mustexist = false;
};

struct TupleConfig
{
    std::string sep = ", ";
    std::optional<std::vector<std::string>> options;
    Aliases aliases;
    bool dedup = false;
};

struct OptionConfig
{
    std::vector<std::string> options;
    Aliases aliases;
};

// Length-bounded text. Lengths count code points, not bytes.
class String
{
public:
    static auto constexpr Unlimited = std::numeric_limits<size_t>::max();

    using Config = StringConfig;

    [[nodiscard]] static std::optional<String> make(std::string_view value, Config config = {}, sc_error* error = nullptr);

    [[nodiscard]] auto value() const noexcept
    {
        return std::string_view{ value_ };
    }

    [[nodiscard]] constexpr auto const& config() const noexcept
    {
        return config_;
    }

    [[nodiscard]] std::string to_string() const
    {
        return value_;
    }

    [[nodiscard]] std::string syntax() const;

    [[nodiscard]] bool operator==(String const& that) const noexcept
    {
        return value_ == that.value_;
    }

private:
    String(std::string value, Config config)
        : value_{ std::move(value) }
        , config_{ config }
    {
    }

    std::string value_;
    Config config_;
};

// A boolean that prints as the first of its truthy or falsy words.
class Bool
{
public:
    using Config = BoolConfig;

    [[nodiscard]] static std::optional<Bool> make(std::string_view value, Config config = {}, sc_error* error = nullptr);

    [[nodiscard]] constexpr auto value() const noexcept
    {
        return value_;
    }

    [[nodiscard]] explicit constexpr operator bool() const noexcept
    {
        return value_;
    }

    [[nodiscard]] auto const& config() const noexcept
    {
        return config_;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::string syntax() const;

    [[nodiscard]] constexpr bool operator==(Bool const& that) const noexcept
    {
        return value_ == that.value_;
    }

private:
    Bool(bool value, Config config)
        : config_{ std::move(config) }
        , value_{ value }
    {
    }

    Config config_;
    bool value_ = false;
};

// A normalized file system path; `~` is expanded on the way in and restored on the way out.
class Path
{
public:
    using Config = PathConfig;

    [[nodiscard]] static std::optional<Path> make(std::string_view value, Config config = {}, sc_error* error = nullptr);

    [[nodiscard]] auto value() const noexcept
    {
        return std::string_view{ value_ };
    }

    [[nodiscard]] constexpr auto const& config() const noexcept
    {
        return config_;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] static std::string_view syntax();

    [[nodiscard]] bool operator==(Path const& that) const noexcept
    {
        return value_ == that.value_;
    }

private:
    Path(std::string value, Config config)
        : value_{ std::move(value) }
        , config_{ config }
    {
    }

    std::string value_;
    Config config_;
};

// An immutable list. String input is split on the separator.
class Tuple
{
public:
    using Config = TupleConfig;

    [[nodiscard]] static std::optional<Tuple> make(
        std::vector<std::string> const& values,
        Config config = {},
        sc_error* error = nullptr);

    [[nodiscard]] static std::optional<Tuple> make(std::string_view value, Config config = {}, sc_error* error = nullptr);

    [[nodiscard]] auto const& items() const noexcept
    {
        return items_;
    }

    [[nodiscard]] auto size() const noexcept
    {
        return std::size(items_);
    }

    [[nodiscard]] auto const& config() const noexcept
    {
        return config_;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::string syntax() const;

    [[nodiscard]] bool operator==(Tuple const& that) const noexcept
    {
        return items_ == that.items_;
    }

private:
    Tuple(std::vector<std::string> items, Config config)
        : items_{ std::move(items) }
        , config_{ std::move(config) }
    {
    }

    std::vector<std::string> items_;
    Config config_;
};

// One string out of a fixed set.
class Option
{
public:
    using Config = OptionConfig;

    [[nodiscard]] static std::optional<Option> make(std::string_view value, Config config, sc_error* error = nullptr);

    [[nodiscard]] auto value() const noexcept
    {
        return std::string_view{ value_ };
    }

    [[nodiscard]] auto const& config() const noexcept
    {
        return config_;
    }

    [[nodiscard]] std::string to_string() const
    {
        return value_;
    }

    [[nodiscard]] std::string syntax() const;

    [[nodiscard]] bool operator==(Option const& that) const noexcept
    {
        return value_ == that.value_;
    }

private:
    Option(std::string value, Config config)
        : value_{ std::move(value) }
        , config_{ std::move(config) }
    {
    }

    std::string value_;
    Config config_;
};

// ---

using Value = std::variant<String, Bool, Path, Tuple, Option, Number>;

// Untyped input on its way to becoming a Value: a literal, a list of literals, or a computed Number.
using Input = std::variant<std::string, std::vector<std::string>, Number>;

/**
 * Build a new Value of the same type and constraints as `prototype` from `input`.
 * Fails with SC_ERROR_VALIDATION if `input` is not acceptable.
 */
[[nodiscard]] std::optional<Value> convert(Value const& prototype, Input const& input, sc_error* error = nullptr);

[[nodiscard]] std::string to_string(Value const& value);

[[nodiscard]] std::string to_string(Input const& input);

[[nodiscard]] std::string syntax(Value const& value);

[[nodiscard]] constexpr bool is_sequence(Value const& value) noexcept
{
    return std::holds_alternative<Tuple>(value);
}

[[nodiscard]] constexpr Number const* as_number(Value const& value) noexcept
{
    return std::get_if<Number>(&value);
}

} // namespace libseedctl
