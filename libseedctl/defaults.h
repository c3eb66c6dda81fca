// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libseedctl/settings.h"

namespace libseedctl
{
class DataCountConverter;
class SettingsApi;

// $XDG_CONFIG_HOME/seedctl, falling back to ~/.config/seedctl
[[nodiscard]] std::string default_config_dir();

// $XDG_CACHE_HOME/seedctl, falling back to ~/.cache/seedctl
[[nodiscard]] std::string default_cache_dir();

[[nodiscard]] std::string default_rc_file();

[[nodiscard]] std::string default_history_file();

[[nodiscard]] std::vector<LocalSetting> local_catalog();

// `api` and `bandwidth` must outlive the registry the catalog is loaded into.
[[nodiscard]] std::vector<std::pair<std::string, RemoteAccessor>> remote_catalog(
    SettingsApi& api,
    DataCountConverter const& bandwidth);

// Literals that mean "no rate limit".
[[nodiscard]] bool is_unlimited_literal(std::string_view str);

} // namespace libseedctl
