// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string>
#include <string_view>
#include <vector>

struct sc_error;

namespace libseedctl
{
struct KeyBinding
{
    // one key or a space-separated key chain, e.g. "ctrl-n" or "f a"
    std::string key;

    // the command line the key runs
    std::string action;

    // empty for the default context
    std::string context;

    std::string description;

    [[nodiscard]] bool operator==(KeyBinding const& that) const
    {
        return key == that.key && action == that.action && context == that.context && description == that.description;
    }
};

// The terminal UI's key bindings, seen only through what they can list and bind.
class KeyMap
{
public:
    virtual ~KeyMap() = default;

    // sorted
    [[nodiscard]] virtual std::vector<std::string> contexts() const = 0;

    [[nodiscard]] virtual std::vector<KeyBinding> bindings(std::string_view context) const = 0;

    [[nodiscard]] virtual bool bind(KeyBinding const& binding, sc_error* error) = 0;
};

[[nodiscard]] std::vector<KeyBinding> const& default_keymap();

// Bind every entry of default_keymap(). Keeps going after a failure and reports the first one.
bool load_default_keymap(KeyMap& keymap, sc_error* error = nullptr);

[[nodiscard]] bool is_default_keybinding(KeyBinding const& binding);

} // namespace libseedctl
