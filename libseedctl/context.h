// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "libseedctl/converter.h"
#include "libseedctl/observable.h"
#include "libseedctl/sc-macros.h"
#include "libseedctl/settings.h"
#include "libseedctl/value-resolution.h"

namespace libseedctl
{
class CommandRunner;
class KeyMap;
class SettingsApi;
class TorrentApi;

/**
 * Everything a command needs: the settings, the unit converters
 * and the daemon's API. Created once by the process entry point.
 */
class Context
{
public:
    using MessageHandler = std::function<void(std::string_view)>;

    Context(SettingsApi& settings_api, TorrentApi& torrent_api, CommandRunner* runner = nullptr, KeyMap* keymap = nullptr);
    ~Context();
    SC_DISABLE_COPY_MOVE(Context)

    [[nodiscard]] constexpr auto& settings() noexcept
    {
        return settings_;
    }

    [[nodiscard]] constexpr auto& local() noexcept
    {
        return local_;
    }

    [[nodiscard]] constexpr auto& remote() noexcept
    {
        return remote_;
    }

    [[nodiscard]] constexpr auto const& bandwidth() const noexcept
    {
        return bandwidth_;
    }

    [[nodiscard]] constexpr auto const& size() const noexcept
    {
        return size_;
    }

    [[nodiscard]] constexpr auto& settings_api() noexcept
    {
        return settings_api_;
    }

    [[nodiscard]] constexpr auto& torrent_api() noexcept
    {
        return torrent_api_;
    }

    // nullptr if commands can't be replayed, e.g. in tests
    [[nodiscard]] constexpr auto* runner() noexcept
    {
        return runner_;
    }

    // nullptr if there is no interactive interface
    [[nodiscard]] constexpr auto* keymap() noexcept
    {
        return keymap_;
    }

    [[nodiscard]] auto const& evaluator() const noexcept
    {
        return evaluator_;
    }

    void set_evaluator(Evaluator evaluator)
    {
        evaluator_ = std::move(evaluator);
    }

    // where the rc file and relative rc file arguments live
    [[nodiscard]] auto config_dir() const noexcept
    {
        return std::string_view{ config_dir_ };
    }

    void set_config_dir(std::string_view dir)
    {
        config_dir_.assign(dir);
    }

    // user-visible output; defaults to the log
    void info(std::string_view msg) const;
    void error(std::string_view msg) const;

    void set_info_handler(MessageHandler handler)
    {
        info_handler_ = std::move(handler);
    }

    void set_error_handler(MessageHandler handler)
    {
        error_handler_ = std::move(handler);
    }

private:
    void on_local_changed(std::string_view name);

    SettingsApi& settings_api_;
    TorrentApi& torrent_api_;
    CommandRunner* const runner_;
    KeyMap* const keymap_;

    // the remote catalog refers to the converters, so they must outlive it
    DataCountConverter bandwidth_;
    DataCountConverter size_;

    LocalSettings local_;
    RemoteSettings remote_;
    CombinedSettings settings_;

    Evaluator evaluator_;
    std::string config_dir_;
    MessageHandler info_handler_;
    MessageHandler error_handler_;

    std::vector<ObserverTag> tags_;
};

} // namespace libseedctl
