// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "libseedctl/stringables.h"
#include "libseedctl/subprocess.h"
#include "libseedctl/values.h"

struct sc_error;

namespace libseedctl
{
class CombinedSettings;

enum class Operator
{
    Add,
    Subtract
};

[[nodiscard]] std::string_view to_string(Operator op) noexcept;

// Apply `op` to `current` and `delta`. The result keeps `current`'s configuration.
[[nodiscard]] std::optional<Number> apply(Operator op, Number const& current, Number const& delta, sc_error* error = nullptr);

// Runs a shell command. Replaceable so that tests don't need a shell.
using Evaluator = std::function<std::optional<sc_spawn_result>(std::string_view command, sc_error* error)>;

// "connect.password:eval" -> "connect.password"
[[nodiscard]] std::string_view strip_eval_suffix(std::string_view name, bool* is_eval = nullptr);

/**
 * Run `command` and return its standard output without leading or trailing newlines.
 *
 * Anything written to standard error is a failure, regardless of the exit code:
 * the error is SC_ERROR_SHELL with the standard error text as its message.
 */
[[nodiscard]] std::optional<std::string> eval_shell(
    std::string_view command,
    sc_error* error = nullptr,
    Evaluator const& evaluator = {});

// Split every argument on ',' and strip whitespace around each item. Empty items are dropped.
[[nodiscard]] std::vector<std::string> listify_args(std::vector<std::string> const& args);

struct OperatorSplit
{
    // nullopt if the literal is an absolute value
    std::optional<Operator> op;
    std::optional<Number> delta;
};

// Detect a leading "+=" or "-=". Fails if what follows the operator is not a number.
[[nodiscard]] std::optional<OperatorSplit> split_operator(std::string_view literal, sc_error* error = nullptr);

/**
 * Change a setting from raw command arguments.
 *
 * `name` may end with ":eval", in which case `args` are joined into a shell
 * command whose output becomes the new value. Numeric settings accept
 * "+=" and "-=" to adjust their current value.
 *
 * Errors from the setting's type are SC_ERROR_VALIDATION and name both the
 * setting and the attempted value; connectivity errors pass through unchanged.
 */
bool set_setting(
    CombinedSettings& settings,
    std::string_view name,
    std::vector<std::string> const& args,
    sc_error* error = nullptr,
    Evaluator const& evaluator = {});

} // namespace libseedctl
