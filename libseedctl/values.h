// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <array>
#include <cstdint> // for uint64_t
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

struct sc_error;

namespace libseedctl
{
// Which magnitude-prefix table a Number parses and prints with.
enum class Prefix
{
    Metric,
    Binary
};

[[nodiscard]] std::string_view to_string(Prefix prefix) noexcept;
[[nodiscard]] std::optional<Prefix> prefix_from_string(std::string_view str) noexcept;

namespace Values
{
struct Multiplier
{
    std::string_view name;
    uint64_t size;
};

// Largest first, so the first entry not exceeding a value is the one to print with.
inline constexpr auto BinaryMultipliers = std::array<Multiplier, 4>{ {
    { "Ti", uint64_t{ 1024U } * 1024U * 1024U * 1024U },
    { "Gi", uint64_t{ 1024U } * 1024U * 1024U },
    { "Mi", uint64_t{ 1024U } * 1024U },
    { "Ki", uint64_t{ 1024U } },
} };

inline constexpr auto MetricMultipliers = std::array<Multiplier, 4>{ {
    { "T", uint64_t{ 1000U } * 1000U * 1000U * 1000U },
    { "G", uint64_t{ 1000U } * 1000U * 1000U },
    { "M", uint64_t{ 1000U } * 1000U },
    { "k", uint64_t{ 1000U } },
} };

[[nodiscard]] constexpr auto const& multipliers(Prefix prefix) noexcept
{
    return prefix == Prefix::Binary ? BinaryMultipliers : MetricMultipliers;
}

// Free-standing number formatter used for every Number's string form.
// Integral results get no decimals, results under 10 up to two,
// results under 100 up to one; trailing zeros are dropped.
[[nodiscard]] std::string pretty_float(double value);

} // namespace Values

struct NumberConfig
{
    // "b" (bit), "B" (byte), any other free-form unit, or empty
    std::string unit;
    Prefix prefix = Prefix::Metric;
    bool hide_unit = false;
    double min = -std::numeric_limits<double>::infinity();
    double max = std::numeric_limits<double>::infinity();
    bool precise = false;
};

/**
 * A self-validating number with an optional unit and magnitude prefix.
 *
 * Numbers are immutable. Arithmetic returns a new Number that keeps this
 * Number's configuration and narrows to Type::Integer when the exact result
 * is integral.
 */
class Number
{
public:
    static auto constexpr Infinity = std::numeric_limits<double>::infinity();

    enum class Type
    {
        Float,
        Integer
    };

    using Config = NumberConfig;

    Number() = default;

    /**
     * Make a Number from a plain value.
     *
     * If `convert_to` names a unit different from `config.unit`, the value is
     * converted: bytes to bits multiply by 8, bits to bytes divide by 8. A
     * Number without a unit is assumed to already be in `convert_to`.
     */
    [[nodiscard]] static std::optional<Number> make(
        double value,
        Type type = Type::Float,
        Config config = {},
        std::string_view convert_to = {},
        sc_error* error = nullptr);

    /**
     * Parse `[+|-]NUMBER[ ][PREFIX][UNIT]` where PREFIX is one of
     * Ti, Gi, Mi, Ki (binary) or T, G, M, k (metric), case-insensitive.
     * A detected prefix selects the matching prefix table, a detected unit
     * overrides `config.unit`.
     */
    [[nodiscard]] static std::optional<Number> parse(
        std::string_view str,
        Type type = Type::Float,
        Config config = {},
        std::string_view convert_to = {},
        sc_error* error = nullptr);

    [[nodiscard]] constexpr auto value() const noexcept
    {
        return value_;
    }

    [[nodiscard]] constexpr auto type() const noexcept
    {
        return type_;
    }

    [[nodiscard]] constexpr auto is_integer() const noexcept
    {
        return type_ == Type::Integer;
    }

    [[nodiscard]] bool is_infinite() const noexcept;

    [[nodiscard]] constexpr auto const& config() const noexcept
    {
        return config_;
    }

    [[nodiscard]] auto unit() const noexcept
    {
        return std::string_view{ config_.unit };
    }

    [[nodiscard]] constexpr auto prefix() const noexcept
    {
        return config_.prefix;
    }

    // A copy with different bounds. Only widening is meaningful; no validation is done.
    [[nodiscard]] Number with_bounds(double min, double max) const;

    [[nodiscard]] std::string to_string() const;
    [[nodiscard]] std::string to_string(bool with_unit, bool precise) const;

    [[nodiscard]] static std::string_view syntax();

    [[nodiscard]] std::optional<Number> add(Number const& that, sc_error* error = nullptr) const;
    [[nodiscard]] std::optional<Number> subtract(Number const& that, sc_error* error = nullptr) const;
    [[nodiscard]] std::optional<Number> multiply(Number const& that, sc_error* error = nullptr) const;
    [[nodiscard]] std::optional<Number> divide(Number const& that, sc_error* error = nullptr) const;
    [[nodiscard]] std::optional<Number> floor(sc_error* error = nullptr) const;
    [[nodiscard]] std::optional<Number> ceil(sc_error* error = nullptr) const;
    [[nodiscard]] std::optional<Number> round(sc_error* error = nullptr) const;

    [[nodiscard]] constexpr auto operator==(Number const& that) const noexcept
    {
        return value_ == that.value_;
    }

    [[nodiscard]] constexpr auto operator!=(Number const& that) const noexcept
    {
        return !(*this == that);
    }

    [[nodiscard]] constexpr auto operator<(Number const& that) const noexcept
    {
        return value_ < that.value_;
    }

private:
    Number(double value, Type type, Config config)
        : config_{ std::move(config) }
        , value_{ value }
        , type_{ type }
    {
    }

    // the other operand expressed in this Number's unit, if both are bit/byte units
    [[nodiscard]] double operand(Number const& that) const;

    template<typename Op>
    [[nodiscard]] std::optional<Number> do_math(Op op, sc_error* error) const;

    Config config_;
    double value_ = {};
    Type type_ = Type::Float;
};

// Canonical short form of a data-count unit: "bit" becomes "b", "byte" becomes "B".
[[nodiscard]] std::string_view canonical_unit(std::string_view unit) noexcept;

[[nodiscard]] constexpr bool is_data_unit(std::string_view unit) noexcept
{
    return unit == "b" || unit == "B" || unit == "bit" || unit == "byte";
}

} // namespace libseedctl
