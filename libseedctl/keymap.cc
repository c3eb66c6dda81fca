// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "libseedctl/error.h"
#include "libseedctl/keymap.h"
#include "libseedctl/log.h"

namespace libseedctl
{
std::vector<KeyBinding> const& default_keymap()
{
    static auto const keymap = std::vector<KeyBinding>{
        // vi and emacs navigation
        { "h", "<left>", "", "" },
        { "j", "<down>", "", "" },
        { "k", "<up>", "", "" },
        { "l", "<right>", "", "" },
        { "g", "<home>", "", "" },
        { "G", "<end>", "", "" },
        { "ctrl-n", "<down>", "", "" },
        { "ctrl-p", "<up>", "", "" },
        { "ctrl-f", "<right>", "", "" },
        { "ctrl-b", "<left>", "", "" },

        { "q", "quit", "main", "" },
        { ":", "tui show cli", "main", "" },

        { "F1+c", "tab help commands", "main", "" },
        { "F1+s", "tab help settings", "main", "" },
        { "F1+k", "tab help keymap", "main", "" },
        { "F1+f", "tab help filtering", "main", "" },
        { "F1+r", "tab help rcfile", "main", "" },
        { "?", "<F1>", "main", "" },

        { "meta-L", "tui toggle log", "main", "" },
        { "meta-M", "tui toggle main", "main", "" },
        { "meta-T", "tui toggle topbar", "main", "" },
        { "meta-B", "tui toggle bottombar", "main", "" },

        { "ctrl-l", "log clear", "main", "" },
        { "alt-pgup", "log scroll page up", "main", "" },
        { "alt-pgdn", "log scroll page down", "main", "" },
        { "alt-home", "log scroll top", "main", "" },
        { "alt-end", "log scroll bottom", "main", "" },

        // bandwidth limits
        { "shift-up", "set srv.limit.rate.down +=100kB", "main", "" },
        { "shift-down", "set srv.limit.rate.down -=100kB", "main", "" },
        { "shift-right", "set srv.limit.rate.up +=100kB", "main", "" },
        { "shift-left", "set srv.limit.rate.up -=100kB", "main", "" },

        { "n", "tab", "tabs", "" },
        { "d", "tab --close", "tabs", "" },
        { "D", "tab --close --focus left", "tabs", "" },
        { "meta-1", "tab --focus 1", "tabs", "" },
        { "meta-2", "tab --focus 2", "tabs", "" },
        { "meta-3", "tab --focus 3", "tabs", "" },
        { "meta-4", "tab --focus 4", "tabs", "" },
        { "meta-5", "tab --focus 5", "tabs", "" },
        { "meta-6", "tab --focus 6", "tabs", "" },
        { "meta-7", "tab --focus 7", "tabs", "" },
        { "meta-8", "tab --focus 8", "tabs", "" },
        { "meta-9", "tab --focus 9", "tabs", "" },
        { "meta-0", "tab --focus 10", "tabs", "" },

        { "f a", "tab ls active", "tabs", "" },
        { "f A", "tab ls !active", "tabs", "" },
        { "f i", "tab ls isolated --columns name,tracker,error", "tabs", "" },
        { "f p", "tab ls paused", "tabs", "" },
        { "f P", "tab ls !paused", "tabs", "" },
        { "f c", "tab ls complete", "tabs", "" },
        { "f C", "tab ls !complete", "tabs", "" },
        { "f u", "tab ls uploading", "tabs", "" },
        { "f d", "tab ls downloading", "tabs", "" },
        { "f s", "tab ls seeding", "tabs", "" },
        { "f l", "tab ls leeching", "tabs", "" },
        { "f .", "tab ls", "tabs", "" },

        { "s d", "sort --add dir", "torrentlist", "" },
        { "s D", "sort --add !dir", "torrentlist", "" },
        { "s e", "sort --add eta", "torrentlist", "" },
        { "s E", "sort --add !eta", "torrentlist", "" },
        { "s n", "sort --add name", "torrentlist", "" },
        { "s N", "sort --add !name", "torrentlist", "" },
        { "s o", "sort --add ratio", "torrentlist", "" },
        { "s O", "sort --add !ratio", "torrentlist", "" },
        { "s p", "sort --add progress", "torrentlist", "" },
        { "s P", "sort --add !progress", "torrentlist", "" },
        { "s r", "sort --add rate", "torrentlist", "" },
        { "s R", "sort --add !rate", "torrentlist", "" },
        { "s s", "sort --add seeds", "torrentlist", "" },
        { "s S", "sort --add !seeds", "torrentlist", "" },
        { "s t", "sort --add tracker", "torrentlist", "" },
        { "s T", "sort --add !tracker", "torrentlist", "" },
        { "s z", "sort --add size", "torrentlist", "" },
        { "s Z", "sort --add !size", "torrentlist", "" },
        { "s ,", "sort --reset", "torrentlist", "" },
        { "s .", "sort --none", "torrentlist", "" },

        { "t a", "announce", "torrent", "" },
        { "t d", "delete", "torrent", "" },
        { "t D", "delete --delete-files", "torrent", "" },
        { "t p", "tab peerlist", "torrent", "" },
        { "t s", "start --toggle", "torrent", "" },
        { "t S", "start --toggle --force", "torrent", "" },
        { "t v", "verify", "torrent", "" },
        { "enter", "tab details", "torrent", "" },
        { "alt-enter", "tab filelist", "torrent", "" },
        { "space", "mark --toggle --focus-next", "torrent", "" },
        { "alt-space", "mark --toggle --all", "torrent", "" },

        { "s c", "sort --add country", "peerlist", "" },
        { "s C", "sort --add !country", "peerlist", "" },
        { "s d", "sort --add rate-down", "peerlist", "" },
        { "s D", "sort --add !rate-down", "peerlist", "" },
        { "s e", "sort --add eta", "peerlist", "" },
        { "s E", "sort --add !eta", "peerlist", "" },
        { "s l", "sort --add client", "peerlist", "" },
        { "s L", "sort --add !client", "peerlist", "" },
        { "s p", "sort --add progress", "peerlist", "" },
        { "s P", "sort --add !progress", "peerlist", "" },
        { "s u", "sort --add rate-up", "peerlist", "" },
        { "s U", "sort --add !rate-up", "peerlist", "" },
        { "s s", "sort --add rate-est", "peerlist", "" },
        { "s S", "sort --add !rate-est", "peerlist", "" },
        { "s r", "sort --add rate", "peerlist", "" },
        { "s R", "sort --add !rate", "peerlist", "" },
        { "s t", "sort --add torrent", "peerlist", "" },
        { "s T", "sort --add !torrent", "peerlist", "" },
        { "s ,", "sort --reset", "peerlist", "" },
        { "s .", "sort --none", "peerlist", "" },

        { "+", "priority high", "file", "" },
        { "=", "priority normal", "file", "" },
        { "-", "priority low", "file", "" },
        { "0", "priority shun", "file", "" },
        { "space", "mark --toggle --focus-next", "file", "" },
        { "alt-space", "mark --toggle --all", "file", "" },
    };

    return keymap;
}

bool load_default_keymap(KeyMap& keymap, sc_error* error)
{
    auto first_error = sc_error{};

    for (auto const& binding : default_keymap())
    {
        auto local_error = sc_error{};
        if (!keymap.bind(binding, &local_error))
        {
            sc_logAddWarn(fmt::format("Couldn't bind '{:s}' to '{:s}': {:s}", binding.key, binding.action, local_error.message()));

            if (!first_error)
            {
                first_error = std::move(local_error);
            }
        }
    }

    if (first_error)
    {
        sc_error_propagate(error, std::move(first_error));
        return false;
    }

    return true;
}

bool is_default_keybinding(KeyBinding const& binding)
{
    auto const& keymap = default_keymap();
    return std::find(std::begin(keymap), std::end(keymap), binding) != std::end(keymap);
}

} // namespace libseedctl
