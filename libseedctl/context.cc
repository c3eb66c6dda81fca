// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#include <string>
#include <string_view>

#include <fmt/core.h>

#include "libseedctl/context.h"
#include "libseedctl/defaults.h"
#include "libseedctl/error.h"
#include "libseedctl/log.h"
#include "libseedctl/transfer-api.h"
#include "libseedctl/utils.h"

using namespace std::literals;

namespace libseedctl
{
Context::Context(SettingsApi& settings_api, TorrentApi& torrent_api, CommandRunner* runner, KeyMap* keymap)
    : settings_api_{ settings_api }
    , torrent_api_{ torrent_api }
    , runner_{ runner }
    , keymap_{ keymap }
    , size_{ "B"sv, Prefix::Binary }
    , remote_{ [this](sc_error* error) { return settings_api_.update(error); } }
    , settings_{ local_, remote_ }
    , config_dir_{ default_config_dir() }
{
    local_.load(local_catalog());
    remote_.load(remote_catalog(settings_api_, bandwidth_));

    // pick up the catalog defaults, then follow changes
    for (auto const name : { "unit.bandwidth"sv, "unitprefix.bandwidth"sv, "unit.size"sv, "unitprefix.size"sv })
    {
        on_local_changed(name);
        tags_.emplace_back(local_.observe_changed(name, [this](std::string_view changed) { on_local_changed(changed); }));
    }
}

Context::~Context() = default;

void Context::on_local_changed(std::string_view name)
{
    auto* const converter = sc_strv_ends_with(name, ".bandwidth"sv) ? &bandwidth_ :
        sc_strv_ends_with(name, ".size"sv)                        ? &size_ :
                                                                    nullptr;
    if (converter == nullptr)
    {
        return;
    }

    auto const* const value = local_.get(name);
    if (value == nullptr)
    {
        return;
    }

    auto const str = to_string(*value);
    auto error = sc_error{};

    if (sc_strv_starts_with(name, "unitprefix."sv))
    {
        converter->set_prefix(str, &error);
    }
    else if (sc_strv_starts_with(name, "unit."sv))
    {
        converter->set_unit(str, &error);
    }

    if (error)
    {
        sc_logAddWarn(fmt::format("Couldn't apply {:s} = {:s}: {:s}", name, str, error.message()));
    }
}

void Context::info(std::string_view msg) const
{
    if (info_handler_)
    {
        info_handler_(msg);
        return;
    }

    sc_logAddInfo(std::string{ msg });
}

void Context::error(std::string_view msg) const
{
    if (error_handler_)
    {
        error_handler_(msg);
        return;
    }

    sc_logAddError(std::string{ msg });
}

} // namespace libseedctl
