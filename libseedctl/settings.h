// This file Copyright © Mnemosyne LLC.
// It may be used under GPLv2 (SPDX: GPL-2.0-only), GPLv3 (SPDX: GPL-3.0-only),
// or any future license endorsed by Mnemosyne LLC.
// License text can be found in the licenses/ folder.

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "libseedctl/observable.h"
#include "libseedctl/sc-macros.h"
#include "libseedctl/stringables.h"

struct sc_error;

namespace libseedctl
{
// A setting that lives in this process: a typed current value plus its default.
struct LocalSetting
{
    std::string name;
    Value default_value;
    std::string description;
};

class LocalSettings
{
public:
    LocalSettings() = default;
    SC_DISABLE_COPY_MOVE(LocalSettings)

    // Add settings from a catalog. Each starts out at its default.
    void load(std::vector<LocalSetting> catalog);

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    // nullptr if `name` is unknown
    [[nodiscard]] Value const* get(std::string_view name) const;
    [[nodiscard]] Value const* default_value(std::string_view name) const;
    [[nodiscard]] std::string_view description(std::string_view name) const;

    // Convert `input` to the setting's type and store it.
    bool set(std::string_view name, Input const& input, sc_error* error = nullptr);

    bool reset(std::string_view name, sc_error* error = nullptr);

    // sorted by name
    [[nodiscard]] std::vector<std::string> names() const;

    // Notified with the setting's name after its value changed.
    [[nodiscard]] ObserverTag observe_changed(ChangeNotifier::Observer observer)
    {
        return changed_.observe(std::move(observer));
    }

    [[nodiscard]] ObserverTag observe_changed(std::string_view name, ChangeNotifier::Observer observer)
    {
        return changed_.observe(name, std::move(observer));
    }

private:
    struct Entry
    {
        Value default_value;
        Value value;
        std::string description;
    };

    [[nodiscard]] Entry const* find(std::string_view name) const;

    std::map<std::string, Entry, std::less<>> entries_;

    ChangeNotifier changed_;
};

// ---

/**
 * How to read and write one setting that lives on the daemon.
 *
 * `fetch` reads the value from the last round trip; `push` sends a new one.
 * `coerce`, if set, replaces the default conversion of user input.
 */
struct RemoteAccessor
{
    using Fetch = std::function<std::optional<Value>(sc_error*)>;
    using Push = std::function<bool(Value const&, sc_error*)>;
    using Coerce = std::function<std::optional<Value>(Input const&, sc_error*)>;

    Value prototype;
    std::string description;
    Fetch fetch;
    Push push;
    Coerce coerce;
};

class RemoteSettings
{
public:
    using Refresh = std::function<bool(sc_error*)>;

    // `refresh` performs the single round trip that update() needs.
    explicit RemoteSettings(Refresh refresh);
    SC_DISABLE_COPY_MOVE(RemoteSettings)

    void load(std::vector<std::pair<std::string, RemoteAccessor>> catalog);

    // Refresh every cached value in one round trip.
    bool update(sc_error* error = nullptr);

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    // The value cached by the last successful update() or set(); nullptr if there is none.
    [[nodiscard]] Value const* get(std::string_view name) const;

    [[nodiscard]] Value const* prototype(std::string_view name) const;
    [[nodiscard]] std::string_view description(std::string_view name) const;

    // Validate `input` and push it to the daemon.
    bool set(std::string_view name, Input const& input, sc_error* error = nullptr);

    // sorted by name
    [[nodiscard]] std::vector<std::string> names() const;

private:
    struct Entry
    {
        RemoteAccessor accessor;
        std::optional<Value> cached;
    };

    Refresh refresh_;
    std::map<std::string, Entry, std::less<>> entries_;
};

// ---

/**
 * One namespace over the local and remote registries.
 * Lookups check local settings first, then remote ones.
 */
class CombinedSettings
{
public:
    CombinedSettings(LocalSettings& local, RemoteSettings& remote)
        : local_{ local }
        , remote_{ remote }
    {
    }

    SC_DISABLE_COPY_MOVE(CombinedSettings)

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    [[nodiscard]] bool is_remote(std::string_view name) const noexcept;

    // nullptr if `name` is unknown or a remote value is not available yet
    [[nodiscard]] Value const* get(std::string_view name) const;

    [[nodiscard]] std::string_view description(std::string_view name) const;

    bool update(sc_error* error = nullptr);

    // SC_ERROR_NOT_FOUND for unknown names
    bool set(std::string_view name, Input const& input, sc_error* error = nullptr);

    // SC_ERROR_NOT_IMPLEMENTED for remote settings, SC_ERROR_NOT_FOUND for unknown names
    bool reset(std::string_view name, sc_error* error = nullptr);

    // local and remote names, sorted
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] constexpr auto& local() noexcept
    {
        return local_;
    }

    [[nodiscard]] constexpr auto& remote() noexcept
    {
        return remote_;
    }

private:
    LocalSettings& local_;
    RemoteSettings& remote_;
};

} // namespace libseedctl
